/***************************************************************
 *  dispatch.hpp
 *
 *  Dispatch decision and task executors.
 *
 *  Parallel override:
 *      "always"   : always use worker processes
 *      "disable"  : always run in the calling process
 *      (absent)   : heuristic, parallel iff more than one task
 *                   and more than 200 observations
 *
 *  Executors:
 *      SequentialExecutor
 *          Runs jobs in order in the calling process.
 *
 *      ProcessPoolExecutor
 *          Forks a bounded number of worker processes. Worker w
 *          runs jobs w, w + W, w + 2W, ... and streams
 *          (job index, value) records back through a pipe.
 *          Results are placed by job index, so completion order
 *          never affects the output order.
 *
 *  Failure policy:
 *      Any failed job or worker aborts the whole run. All
 *      workers are reaped before the error is raised, and no
 *      partial result is returned.
 *
 *  Platform:
 *      ProcessPoolExecutor uses POSIX fork / pipe / waitpid.
 *
 *  License: GPL-3
 ***************************************************************/

#ifndef DISPATCH_HPP
#define DISPATCH_HPP

#include <vector>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace Dispatch
{
    // Heuristic thresholds: parallel iff n_tasks > 1 and n_obs > 200
    constexpr size_t kParallelTaskThreshold = 1;
    constexpr size_t kParallelObsThreshold  = 200;

    enum class ParallelMode : uint8_t {
        Auto,
        Always,
        Disable
    };

    /*
     * @brief Parses the user supplied parallel override.
     *
     * Only called when the caller actually supplied a value; an absent
     * override is ParallelMode::Auto.
     *
     * @throws std::invalid_argument for anything but "always" or "disable".
     */
    inline ParallelMode ParseParallelMode(const std::string& mode)
    {
        if (mode == "always")  return ParallelMode::Always;
        if (mode == "disable") return ParallelMode::Disable;
        throw std::invalid_argument("unrecognized value for parallel argument");
    }

    inline bool ShouldBeParallel(
        ParallelMode mode,
        size_t n_tasks,
        size_t n_obs)
    {
        switch (mode) {
            case ParallelMode::Always:
                return true;
            case ParallelMode::Disable:
                return false;
            default:
                return n_tasks > kParallelTaskThreshold && n_obs > kParallelObsThreshold;
        }
    }

    // Number of online processors, at least 1
    inline size_t DefaultWorkerCount()
    {
        const long n = ::sysconf(_SC_NPROCESSORS_ONLN);
        return n > 0 ? static_cast<size_t>(n) : 1;
    }

    using Job = std::function<double(size_t)>;

    /***********************************************************
     * Executor interface
     *
     * Run(n_jobs, job) evaluates job(0) ... job(n_jobs - 1) and
     * returns the values in job index order.
     ***********************************************************/
    class Executor
    {
    public:
        virtual ~Executor() = default;

        virtual std::vector<double> Run(size_t n_jobs, const Job& job) const = 0;
    };

    class SequentialExecutor : public Executor
    {
    public:
        std::vector<double> Run(size_t n_jobs, const Job& job) const override
        {
            std::vector<double> out;
            out.reserve(n_jobs);
            for (size_t i = 0; i < n_jobs; ++i)
            {
                out.push_back(job(i));
            }
            return out;
        }
    };

    namespace detail
    {
        constexpr uint8_t kResultRecord = 1;
        constexpr uint8_t kErrorRecord  = 2;

        inline bool WriteAll(int fd, const void* buf, size_t len) noexcept
        {
            const char* p = static_cast<const char*>(buf);
            while (len > 0)
            {
                const ssize_t w = ::write(fd, p, len);
                if (w < 0)
                {
                    if (errno == EINTR) continue;
                    return false;
                }
                p   += w;
                len -= static_cast<size_t>(w);
            }
            return true;
        }

        // Returns the number of bytes read, short only at EOF
        inline size_t ReadAll(int fd, void* buf, size_t len)
        {
            char* p = static_cast<char*>(buf);
            size_t got = 0;
            while (got < len)
            {
                const ssize_t r = ::read(fd, p + got, len - got);
                if (r < 0)
                {
                    if (errno == EINTR) continue;
                    throw std::system_error(errno, std::generic_category(),
                                            "read from worker pipe failed");
                }
                if (r == 0) break;
                got += static_cast<size_t>(r);
            }
            return got;
        }

        /*
         * Body of a forked worker. Never returns to the caller's stack.
         *
         * Record layout:
         *   result : tag(1) index(8) value(8)
         *   error  : tag(1) index(8) length(8) message(length)
         */
        inline void WorkerMain(
            int fd,
            size_t worker,
            size_t n_workers,
            size_t n_jobs,
            const Job& job) noexcept
        {
            int status = 0;

            for (size_t i = worker; i < n_jobs; i += n_workers)
            {
                const uint64_t index = static_cast<uint64_t>(i);
                double value = 0.0;
                bool failed = false;
                std::string error;

                try {
                    value = job(i);
                } catch (const std::exception& e) {
                    failed = true;
                    error = e.what();
                } catch (...) {
                    failed = true;
                    error = "unknown exception in task " + std::to_string(i);
                }

                if (!failed)
                {
                    const uint8_t tag = kResultRecord;
                    if (!WriteAll(fd, &tag, sizeof(tag)) ||
                        !WriteAll(fd, &index, sizeof(index)) ||
                        !WriteAll(fd, &value, sizeof(value)))
                    {
                        status = 1;
                        break;
                    }
                }
                else
                {
                    const uint8_t tag = kErrorRecord;
                    const uint64_t len = static_cast<uint64_t>(error.size());
                    if (!WriteAll(fd, &tag, sizeof(tag)) ||
                        !WriteAll(fd, &index, sizeof(index)) ||
                        !WriteAll(fd, &len, sizeof(len)) ||
                        !WriteAll(fd, error.data(), error.size()))
                    {
                        status = 1;
                    }
                    break;
                }
            }

            ::close(fd);
            ::_exit(status);
        }

        /*
         * Reads records from one worker until EOF. The first problem found
         * is stored in failure; reading stops at a malformed record.
         */
        inline void ReadRecords(
            int fd,
            std::vector<double>& results,
            std::vector<uint8_t>& done,
            std::string& failure)
        {
            for (;;)
            {
                uint8_t tag = 0;
                if (ReadAll(fd, &tag, sizeof(tag)) == 0) return;

                uint64_t index = 0;
                if (ReadAll(fd, &index, sizeof(index)) != sizeof(index) ||
                    index >= results.size())
                {
                    if (failure.empty()) failure = "malformed record from worker process";
                    return;
                }

                if (tag == kResultRecord)
                {
                    double value = 0.0;
                    if (ReadAll(fd, &value, sizeof(value)) != sizeof(value))
                    {
                        if (failure.empty()) failure = "truncated result from worker process";
                        return;
                    }
                    results[index] = value;
                    done[index] = 1;
                }
                else if (tag == kErrorRecord)
                {
                    uint64_t len = 0;
                    if (ReadAll(fd, &len, sizeof(len)) != sizeof(len))
                    {
                        if (failure.empty()) failure = "truncated error from worker process";
                        return;
                    }
                    std::string msg(static_cast<size_t>(len), '\0');
                    if (len > 0 && ReadAll(fd, &msg[0], msg.size()) != msg.size())
                    {
                        if (failure.empty()) failure = "truncated error from worker process";
                        return;
                    }
                    if (failure.empty()) failure = msg;
                }
                else
                {
                    if (failure.empty()) failure = "malformed record from worker process";
                    return;
                }
            }
        }

        inline int WaitChild(pid_t pid)
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR) return -1;
            }
            return status;
        }

    } // namespace detail

    class ProcessPoolExecutor : public Executor
    {
    public:
        // workers == 0 uses the online processor count
        explicit ProcessPoolExecutor(size_t workers = 0)
            : workers_(workers == 0 ? DefaultWorkerCount() : workers) {}

        size_t Workers() const noexcept { return workers_; }

        std::vector<double> Run(size_t n_jobs, const Job& job) const override
        {
            if (n_jobs == 0) return std::vector<double>();

            const size_t n_workers = std::min(workers_, n_jobs);

            struct Worker
            {
                pid_t pid;
                int fd;
            };
            std::vector<Worker> pool;
            pool.reserve(n_workers);

            for (size_t w = 0; w < n_workers; ++w)
            {
                int fds[2];
                if (::pipe(fds) != 0)
                {
                    const int err = errno;
                    Abandon(pool);
                    throw std::system_error(err, std::generic_category(),
                                            "cannot create worker pipe");
                }

                const pid_t pid = ::fork();
                if (pid < 0)
                {
                    const int err = errno;
                    ::close(fds[0]);
                    ::close(fds[1]);
                    Abandon(pool);
                    throw std::system_error(err, std::generic_category(),
                                            "cannot fork worker process");
                }

                if (pid == 0)
                {
                    ::close(fds[0]);
                    for (const auto& p : pool) ::close(p.fd);
                    detail::WorkerMain(fds[1], w, n_workers, n_jobs, job);
                }

                ::close(fds[1]);
                pool.push_back(Worker{pid, fds[0]});
            }

            std::vector<double> results(n_jobs, std::numeric_limits<double>::quiet_NaN());
            std::vector<uint8_t> done(n_jobs, 0);
            std::string failure;

            for (size_t w = 0; w < pool.size(); ++w)
            {
                try {
                    detail::ReadRecords(pool[w].fd, results, done, failure);
                } catch (const std::system_error& e) {
                    if (failure.empty()) failure = e.what();
                }
                ::close(pool[w].fd);

                const int status = detail::WaitChild(pool[w].pid);
                const bool clean = status >= 0 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
                if (!clean && failure.empty())
                {
                    failure = "worker process " + std::to_string(w) + " terminated abnormally";
                }
            }

            if (!failure.empty())
            {
                throw std::runtime_error(failure);
            }

            for (size_t i = 0; i < n_jobs; ++i)
            {
                if (!done[i])
                    throw std::runtime_error("worker pool returned no result for task " +
                                             std::to_string(i));
            }

            return results;
        }

    private:
        // Closing the read ends makes remaining workers exit on SIGPIPE
        template <typename Pool>
        static void Abandon(const Pool& pool)
        {
            for (const auto& p : pool) ::close(p.fd);
            for (const auto& p : pool) detail::WaitChild(p.pid);
        }

        size_t workers_;
    };

    inline std::unique_ptr<Executor> MakeExecutor(bool parallel, size_t workers = 0)
    {
        if (parallel)
            return std::make_unique<ProcessPoolExecutor>(workers);
        return std::make_unique<SequentialExecutor>();
    }

    /***********************************************************
     * Map fn over items with the given executor
     ***********************************************************/
    template <typename T, typename Fn>
    inline std::vector<double> Map(
        const Executor& executor,
        const std::vector<T>& items,
        Fn fn)
    {
        return executor.Run(items.size(), [&items, &fn](size_t i) {
            return fn(items[i]);
        });
    }

} // namespace Dispatch

#endif // DISPATCH_HPP
