#include "Executor/executor.hpp"

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <omp.h>
#include <sys/resource.h>

ResultChannel::ResultChannel(int nproducers)
{
    activeProducers = nproducers;
    progress = 0;
}

ResultChannel::~ResultChannel()
{
}

void ResultChannel::push(VisibilityPacket packet)
{
    {
        std::lock_guard<std::mutex> guard(lock);
        queue.push_back(std::move(packet));
    }
    available.notify_one();
}

void ResultChannel::producer_done(int producer, const std::string& error)
{
    {
        std::lock_guard<std::mutex> guard(lock);
        activeProducers--;
        if(!error.empty()) {
            errors.push_back("worker " + std::to_string(producer) + ": " + error);
        }
    }
    available.notify_all();
}

void ResultChannel::increment_progress(void)
{
    std::lock_guard<std::mutex> guard(lock);
    progress++;
}

bool ResultChannel::pop(VisibilityPacket& packet)
{
    std::unique_lock<std::mutex> guard(lock);
    available.wait(guard, [this] { return !queue.empty() || activeProducers <= 0; });
    if(queue.empty()) {
        return false;
    }
    packet = std::move(queue.front());
    queue.pop_front();
    return true;
}

long ResultChannel::get_progress(void) const
{
    std::lock_guard<std::mutex> guard(lock);
    return progress;
}

int ResultChannel::get_active_producers(void) const
{
    std::lock_guard<std::mutex> guard(lock);
    return activeProducers;
}

std::vector<std::string> ResultChannel::get_errors(void) const
{
    std::lock_guard<std::mutex> guard(lock);
    return errors;
}

ParallelExecutor::ParallelExecutor(int nworkers)
{
    if(nworkers < 1) {
        throw std::invalid_argument("[ERROR] Number of workers must be at least 1.");
    }
    nWorkers = nworkers;
    verbose = true;
}

ParallelExecutor::~ParallelExecutor()
{
}

std::vector< std::pair<long, long> > ParallelExecutor::split(long n, int nchunks)
{
    long base;
    long extra;
    long begin;
    std::vector< std::pair<long, long> > chunks;

    if(nchunks < 1) {
        throw std::invalid_argument("[ERROR] Number of chunks must be at least 1.");
    }
    base = n / nchunks;
    extra = n % nchunks;
    begin = 0;
    for(int c = 0; c < nchunks; c++)
    {
        long size = base + (c < extra ? 1 : 0);
        chunks.push_back(std::make_pair(begin, begin + size));
        begin += size;
    }
    return chunks;
}

void ParallelExecutor::run_chunk(int chunk, long begin, long end,
    const Task& task, ResultChannel& channel) const
/** Runs one chunk. Whatever happens, the channel is told that this
 * producer stopped, so that the controller never waits for it forever.
 */
{
    #ifdef EXECUTOR_DEBUG
    std::cerr << "ParallelExecutor::run_chunk" << std::endl;
    std::cerr << "  chunk " << chunk << " [" << begin << ", " << end << ")";
    std::cerr << " on thread " << omp_get_thread_num() << std::endl;
    #endif
    try
    {
        task(begin, end, channel);
        channel.producer_done(chunk);
    }
    catch(const std::exception& e)
    {
        channel.producer_done(chunk, e.what());
    }
    catch(...)
    {
        channel.producer_done(chunk, "unknown exception");
    }
}

void ParallelExecutor::collect(long nitems, long expected, ResultChannel& channel,
    std::vector<VisibilityPacket>& packets) const
{
    long reported = 0;
    long step = nitems / 20 > 0 ? nitems / 20 : 1;
    struct rusage usage;
    VisibilityPacket packet;
    auto start = std::chrono::steady_clock::now();

    while(long(packets.size()) < expected)
    {
        if(!channel.pop(packet)) {
            break;
        }
        packets.push_back(std::move(packet));
        long done = channel.get_progress();
        if(verbose && (done >= reported + step || (done == nitems && reported < nitems)))
        {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            getrusage(RUSAGE_SELF, &usage);
            // ru_maxrss is in kilobytes on Linux
            std::cerr << "Finished " << done << " / " << nitems;
            std::cerr << ", Elapsed " << std::fixed << std::setprecision(2);
            std::cerr << elapsed.count() << " sec";
            std::cerr << ", MaxRSS " << usage.ru_maxrss / 1.0e6 << " GB" << std::endl;
            std::cerr.unsetf(std::ios_base::floatfield);
            reported = done;
        }
    }
}

std::vector<VisibilityPacket> ParallelExecutor::run(long nitems, long expected, const Task& task)
{
    std::vector< std::pair<long, long> > chunks = split(nitems, nWorkers);
    std::vector<VisibilityPacket> packets;
    std::exception_ptr collectorError;
    ResultChannel channel(nWorkers);

    packets.reserve(expected);
    // one thread per chunk plus the collector
    #pragma omp parallel num_threads(nWorkers + 1)
    {
        int tid = omp_get_thread_num();
        int nthreads = omp_get_num_threads();

        if(nthreads == 1)
        {
            for(int c = 0; c < nWorkers; c++) {
                run_chunk(c, chunks[c].first, chunks[c].second, task, channel);
            }
        }
        else if(tid != 0)
        {
            // fewer threads than requested: workers take several chunks
            for(int c = tid - 1; c < nWorkers; c += nthreads - 1) {
                run_chunk(c, chunks[c].first, chunks[c].second, task, channel);
            }
        }
        if(tid == 0)
        {
            try
            {
                collect(nitems, expected, channel, packets);
            }
            catch(...)
            {
                collectorError = std::current_exception();
            }
        }
    }
    if(collectorError) {
        std::rethrow_exception(collectorError);
    }

    std::vector<std::string> errors = channel.get_errors();
    if(!errors.empty())
    {
        std::ostringstream msg;
        msg << "[ERROR] " << errors.size() << " worker(s) failed:";
        for(size_t i = 0; i < errors.size(); i++) {
            msg << " [" << errors[i] << "]";
        }
        throw std::runtime_error(msg.str());
    }
    if(long(packets.size()) != expected)
    {
        throw std::runtime_error("[ERROR] Received " + std::to_string(packets.size())
            + " results while " + std::to_string(expected) + " were expected.");
    }
    return packets;
}
