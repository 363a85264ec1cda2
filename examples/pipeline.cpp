// Pipeline example
//
//   counting_source -> retry -> processor (ring buffer) -> buffer -> sink
//
// The sink requests one window at a time; the buffer turns that into
// batch_size values, the processor consumer thread hands exactly that many
// signals out of the ring, and the processor keeps the ring topped up from the
// retry stage. With --fail-every the source fails periodically and the retry
// stage resubscribes, resuming where the previous subscription stopped.

#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <vector>

#include "fluxring.hpp"

#include "common/cli/pipeline_params.hpp"


namespace {

using namespace fluxring;

// -----------------------------------------------------------------------------
// Synchronous demand-driven source emitting 0..count-1.
// Progress is shared across subscriptions, so a retried subscription resumes.
// -----------------------------------------------------------------------------
class counting_source final : public stream::publisher<std::int64_t> {
    class emission final : public stream::subscription {
    public:
        emission(counting_source& source, std::shared_ptr<stream::subscriber<std::int64_t>> s)
            : source_(source), subscriber_(std::move(s)), demand_(0) {}

        void request(std::int64_t n) override {
            if (n <= 0) {
                cancel();
                subscriber_->on_error(error{error_code::ProtocolViolation, "request(n <= 0)"});
                return;
            }
            stream::add_demand(demand_, n);
            if (emitting_) {
                return;     // re-entrant request from on_next, the loop below picks it up
            }
            emitting_ = true;
            drain_();
            emitting_ = false;
        }

        void cancel() override {
            cancelled_ = true;
        }

    private:
        void drain_() {
            while (!cancelled_ && !done_) {
                if (source_.next_ >= source_.count_) {
                    done_ = true;
                    subscriber_->on_complete();
                    return;
                }
                if (source_.fail_every_ > 0 && delivered_ == source_.fail_every_) {
                    done_ = true;
                    subscriber_->on_error(error::upstream("injected failure at " + std::to_string(source_.next_)));
                    return;
                }
                if (!stream::try_consume_demand(demand_)) {
                    return;
                }
                ++delivered_;
                subscriber_->on_next(source_.next_++);
            }
        }

    private:
        counting_source& source_;
        std::shared_ptr<stream::subscriber<std::int64_t>> subscriber_;
        lcr::sequence demand_;
        std::int64_t delivered_ = 0;
        bool emitting_ = false;
        bool cancelled_ = false;
        bool done_ = false;
    };

public:
    counting_source(std::int64_t count, std::int64_t fail_every)
        : count_(count), fail_every_(fail_every) {}

    void subscribe(std::shared_ptr<stream::subscriber<std::int64_t>> s) override {
        auto e = std::make_shared<emission>(*this, s);
        s->on_subscribe(e);
    }

private:
    const std::int64_t count_;
    const std::int64_t fail_every_;
    std::int64_t next_ = 0;
};

// -----------------------------------------------------------------------------
// Prints windows, one outstanding request at a time
// -----------------------------------------------------------------------------
class window_printer final : public stream::subscriber<std::vector<std::int64_t>> {
public:
    void on_subscribe(std::shared_ptr<stream::subscription> s) override {
        subscription_ = std::move(s);
        subscription_->request(1);
    }

    void on_next(const std::vector<std::int64_t>& window) override {
        ++windows_;
        values_ += static_cast<std::int64_t>(window.size());
        std::cout << "[window " << windows_ << "] " << window.size() << " value(s): "
                  << window.front() << " .. " << window.back() << std::endl;
        subscription_->request(1);
    }

    void on_error(const error& cause) override {
        std::cout << "[sink] error " << to_string(cause.code) << ": " << cause.message << std::endl;
        done_.set_value(false);
    }

    void on_complete() override {
        std::cout << "[sink] complete: " << values_ << " value(s) in " << windows_ << " window(s)" << std::endl;
        done_.set_value(true);
    }

    [[nodiscard]] std::future<bool> done() { return done_.get_future(); }

private:
    std::shared_ptr<stream::subscription> subscription_;
    std::int64_t windows_ = 0;
    std::int64_t values_ = 0;
    std::promise<bool> done_;
};


template <ring::WaitStrategy W>
bool run_pipeline(const examples::cli::PipelineParams& params, const config::profile& prof) {
    auto flush_timer = std::make_shared<timer::thread_timer>();

    op::batch_config window;
    window.batch_size = prof.batch_size;
    window.timespan = prof.timespan;
    window.unit = prof.unit;
    window.timer = flush_timer;
    window.on_empty_complete = prof.on_empty_complete;

    auto source  = std::make_shared<counting_source>(params.count, params.fail_every);
    auto retries = op::make_retry<std::int64_t>(prof.retries, source);
    auto hub     = std::make_shared<ring::processor<std::int64_t, W>>(prof.ring_capacity);
    auto windows = std::make_shared<op::buffer<std::int64_t>>(window);
    auto sink    = std::make_shared<window_printer>();

    auto done = sink->done();

    // Downstream first: demand is deferred until each upstream arrives
    windows->subscribe(sink);
    hub->subscribe(windows);
    retries->subscribe(hub);
    retries->connect();

    const bool ok = done.get();

    hub->shutdown();
    flush_timer->stop();
    return ok;
}

} // namespace


int main(int argc, char** argv) {
    const auto params = fluxring::examples::cli::configure(argc, argv, "fluxring pipeline example");
    params.dump("=== Pipeline Parameters ===", std::cout);

    fluxring::config::profile prof;
    if (!params.profile.empty()) {
        if (fluxring::config::load_profile(params.profile, prof) != fluxring::config::result::Ok) {
            return EXIT_FAILURE;
        }
        if (params.log_level == "info") {
            lcr::log::Logger::instance().set_level(prof.log_level);
        }
    }

    bool ok = false;
    switch (prof.wait) {
        case fluxring::config::wait_kind::busy_spin:
            ok = run_pipeline<fluxring::ring::wait::busy_spin>(params, prof);
            break;
        case fluxring::config::wait_kind::yielding:
            ok = run_pipeline<fluxring::ring::wait::yielding>(params, prof);
            break;
        case fluxring::config::wait_kind::parking:
            ok = run_pipeline<fluxring::ring::wait::parking>(params, prof);
            break;
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
