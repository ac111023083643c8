#include <algorithm>
#include <complex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "Executor/executor.hpp"

BOOST_AUTO_TEST_SUITE(texecutor)

namespace {

// one packet per item, carrying the item index
void PublishItems(long begin, long end, ResultChannel& channel) {
  for (long t = begin; t < end; ++t) {
    VisibilityPacket packet;
    packet.timeIndex = t;
    packet.baselineIndex = 0;
    packet.vis.assign(1, std::complex<double>(double(t), 0.0));
    channel.push(std::move(packet));
    channel.increment_progress();
  }
}

}  // namespace

BOOST_AUTO_TEST_CASE(split) {
  std::vector<std::pair<long, long> > chunks = ParallelExecutor::split(10, 3);
  BOOST_REQUIRE_EQUAL(chunks.size(), 3u);
  BOOST_CHECK_EQUAL(chunks[0].first, 0);
  BOOST_CHECK_EQUAL(chunks[0].second, 4);
  BOOST_CHECK_EQUAL(chunks[1].first, 4);
  BOOST_CHECK_EQUAL(chunks[1].second, 7);
  BOOST_CHECK_EQUAL(chunks[2].first, 7);
  BOOST_CHECK_EQUAL(chunks[2].second, 10);

  // more chunks than items: trailing chunks are empty
  chunks = ParallelExecutor::split(2, 4);
  BOOST_REQUIRE_EQUAL(chunks.size(), 4u);
  BOOST_CHECK_EQUAL(chunks[1].second, 2);
  BOOST_CHECK_EQUAL(chunks[2].first, chunks[2].second);
  BOOST_CHECK_EQUAL(chunks[3].first, chunks[3].second);

  BOOST_CHECK_THROW(ParallelExecutor::split(10, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(channel) {
  ResultChannel channel(2);
  VisibilityPacket packet;
  packet.timeIndex = 3;
  packet.baselineIndex = 1;
  channel.push(packet);
  channel.increment_progress();
  channel.producer_done(0);
  channel.producer_done(1, "disk full");

  BOOST_CHECK_EQUAL(channel.get_active_producers(), 0);
  BOOST_CHECK_EQUAL(channel.get_progress(), 1);
  BOOST_REQUIRE_EQUAL(channel.get_errors().size(), 1u);
  BOOST_CHECK_EQUAL(channel.get_errors()[0], "worker 1: disk full");

  VisibilityPacket received;
  BOOST_CHECK(channel.pop(received));
  BOOST_CHECK_EQUAL(received.timeIndex, 3);
  // queue drained and nobody left to publish
  BOOST_CHECK(!channel.pop(received));
}

BOOST_AUTO_TEST_CASE(all_items_collected) {
  const long nitems = 25;
  for (int nworkers = 1; nworkers <= 6; ++nworkers) {
    ParallelExecutor executor(nworkers);
    executor.set_verbose(false);
    std::vector<VisibilityPacket> packets =
        executor.run(nitems, nitems, PublishItems);
    BOOST_REQUIRE_EQUAL(packets.size(), size_t(nitems));

    std::vector<long> indices;
    for (const VisibilityPacket& packet : packets) {
      indices.push_back(packet.timeIndex);
      BOOST_CHECK_EQUAL(packet.vis[0].real(), double(packet.timeIndex));
    }
    std::sort(indices.begin(), indices.end());
    for (long t = 0; t < nitems; ++t) {
      BOOST_CHECK_EQUAL(indices[t], t);
    }
  }
}

BOOST_AUTO_TEST_CASE(worker_failure) {
  ParallelExecutor executor(3);
  executor.set_verbose(false);
  ParallelExecutor::Task failing = [](long begin, long end,
                                      ResultChannel& channel) {
    if (begin == 0) {
      throw std::runtime_error("out of memory");
    }
    PublishItems(begin, end, channel);
  };
  BOOST_CHECK_THROW(executor.run(9, 9, failing), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(missing_results) {
  ParallelExecutor executor(2);
  executor.set_verbose(false);
  // the second worker publishes nothing
  ParallelExecutor::Task lazy = [](long begin, long end,
                                   ResultChannel& channel) {
    if (begin == 0) {
      PublishItems(begin, end, channel);
    }
  };
  BOOST_CHECK_THROW(executor.run(8, 8, lazy), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(bad_worker_count) {
  BOOST_CHECK_THROW(ParallelExecutor(0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
