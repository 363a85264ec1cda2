#pragma once

// Umbrella header

#include "lcr/sequence.hpp"
#include "lcr/time_unit.hpp"
#include "lcr/log/logger.hpp"

#include "fluxring/error.hpp"
#include "fluxring/signal.hpp"

#include "fluxring/config/ring.hpp"
#include "fluxring/config/batch.hpp"
#include "fluxring/config/profile.hpp"

#include "fluxring/stream/reactive.hpp"
#include "fluxring/stream/demand.hpp"
#include "fluxring/stream/stage.hpp"

#include "fluxring/ring/wait_strategy.hpp"
#include "fluxring/ring/sequence_barrier.hpp"
#include "fluxring/ring/ring_buffer.hpp"
#include "fluxring/ring/routing.hpp"
#include "fluxring/ring/write_with.hpp"
#include "fluxring/ring/processor.hpp"

#include "fluxring/timer/timer.hpp"
#include "fluxring/timer/thread_timer.hpp"

#include "fluxring/op/batch.hpp"
#include "fluxring/op/buffer.hpp"
#include "fluxring/op/retry.hpp"
