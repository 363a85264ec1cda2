#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "fluxring/op/batch.hpp"
#include "fluxring/stream/demand.hpp"


namespace fluxring::op {

// -----------------------------------------------------------------------------
// buffer<T>
// -----------------------------------------------------------------------------
// Collects each window into a std::vector<T> and emits it on flush. Empty
// windows are never emitted. One downstream request(n) is n windows, so
// n * batch_size values are requested upstream.
// -----------------------------------------------------------------------------
template <typename T>
class buffer final : public batch<T, std::vector<T>> {
    using base = batch<T, std::vector<T>>;

public:
    explicit buffer(batch_config cfg)
        : base(prepare_(std::move(cfg)))
    {
        values_.reserve(this->batch_size());
    }

protected:
    void next_callback(const T& value) override {
        values_.push_back(value);
    }

    void flush_callback(const T*) override {
        if (values_.empty()) {
            return;
        }
        std::vector<T> window;
        window.reserve(this->batch_size());
        window.swap(values_);
        this->emit_next(window);
    }

    void request_more(std::int64_t n) override {
        this->forward_request(stream::multiply_cap(n, static_cast<std::int64_t>(this->batch_size())));
    }

private:
    static batch_config prepare_(batch_config cfg) {
        cfg.next  = true;
        cfg.flush = true;
        return cfg;
    }

private:
    std::vector<T> values_;
};

template <typename T>
[[nodiscard]] std::shared_ptr<buffer<T>> make_buffer(std::size_t batch_size) {
    batch_config cfg;
    cfg.batch_size = batch_size;
    return std::make_shared<buffer<T>>(std::move(cfg));
}

template <typename T>
[[nodiscard]] std::shared_ptr<buffer<T>> make_buffer(std::size_t batch_size,
                                                     std::int64_t timespan,
                                                     lcr::time_unit unit,
                                                     std::shared_ptr<timer::timer> timer) {
    batch_config cfg;
    cfg.batch_size = batch_size;
    cfg.timespan = timespan;
    cfg.unit = unit;
    cfg.timer = std::move(timer);
    return std::make_shared<buffer<T>>(std::move(cfg));
}

} // namespace fluxring::op
