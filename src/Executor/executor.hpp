/*
 * executor.hpp
 *
 * Parallel execution of contiguous chunks of work. Every chunk runs in its
 * own OpenMP thread and publishes its results to a ResultChannel, a
 * multi-producer single-consumer queue that also tracks how many producers
 * are still running and how many work items have been completed. The
 * controller drains the channel until it has received the number of
 * results it expects, or until every producer has stopped, in which case
 * the failure of the missing producers is reported.
 *
 */

#ifndef EORSKY_EXECUTORH
#define EORSKY_EXECUTORH

#include <complex>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/* visibilities of one baseline at one time sample. */
struct VisibilityPacket
{
    long timeIndex;
    int baselineIndex;
    /* nskies x nfreqs, frequency fastest. */
    std::vector< std::complex<double> > vis;
};

class ResultChannel
{
    public:

        ResultChannel(int nproducers);
       ~ResultChannel();

        void push(VisibilityPacket packet);
        /* marks a producer as stopped. A non-empty error is kept as the
         * reason it stopped. */
        void producer_done(int producer, const std::string& error = "");
        /* one more work item (time sample) completed. */
        void increment_progress(void);

        /* blocks until a packet is available and moves it into packet.
         * Returns false when every producer is done and the queue is empty. */
        bool pop(VisibilityPacket& packet);

        long get_progress(void) const;
        int get_active_producers(void) const;
        std::vector<std::string> get_errors(void) const;

    private:

        mutable std::mutex lock;
        std::condition_variable available;
        std::deque<VisibilityPacket> queue;
        std::vector<std::string> errors;
        int activeProducers;
        long progress;
};

class ParallelExecutor
{
    public:

        /* work function: processes items [begin, end) of a chunk and
         * publishes to the channel. */
        typedef std::function<void (long begin, long end, ResultChannel& channel)> Task;

        ParallelExecutor(int nworkers);
       ~ParallelExecutor();

        int get_nworkers(void) const { return nWorkers; };
        /* print progress lines to stderr. */
        void set_verbose(bool v) { verbose = v; };

        /* splits [0, n) into nchunks contiguous ranges whose sizes differ
         * by at most one, larger ranges first. Ranges may be empty. */
        static std::vector< std::pair<long, long> > split(long n, int nchunks);

        /* runs task over the nworkers chunks of [0, nitems) and returns
         * the `expected` packets published, in arrival order. Throws
         * runtime_error if a worker fails or fewer packets arrive. */
        std::vector<VisibilityPacket> run(long nitems, long expected, const Task& task);

    private:

        void run_chunk(int chunk, long begin, long end, const Task& task, ResultChannel& channel) const;
        void collect(long nitems, long expected, ResultChannel& channel,
            std::vector<VisibilityPacket>& packets) const;

        int nWorkers;
        bool verbose;
};

#endif
