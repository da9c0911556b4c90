#pragma once

#include "dsync/cache/response_cache.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/governor/clock.hpp"
#include "dsync/governor/rate_governor.hpp"
#include "dsync/remote/memory_service.hpp"
#include "dsync/sync/remote_ops.hpp"

#include <gtest/gtest.h>

namespace dsync::testing {

using Op = remote::MemoryRemoteService::Operation;

/// In-memory store plus the governed, cached operations layer over it
class SyncFixture : public ::testing::Test {
protected:
    SyncFixture()
        : governor(clock, governor::GovernorConfig{}, 42),
          cache(clock),
          ops(service, governor, cache) {
        governor.set_max_retries(3);
        source_root = service.add_root("source");
        dest_root = service.add_root("destination");
    }

    governor::ManualClock clock;
    governor::RateGovernor governor;
    cache::ResponseCache cache;
    remote::MemoryRemoteService service{2};
    events::EventBus bus;
    sync::RemoteOperations ops;

    std::string source_root;
    std::string dest_root;
};

} // namespace dsync::testing
