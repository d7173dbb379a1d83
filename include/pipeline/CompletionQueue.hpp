#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace IpSift
{
namespace Pipeline
{
    /**
     * CompletionQueue
     *
     * Collects task outcomes in the order tasks finish, not the order they
     * were submitted. Workers push; one consumer thread pops.
     *
     * An outcome carries either a value or the exception the task threw;
     * Outcome::get() rethrows on the consumer thread, so a worker failure
     * surfaces where the run is being merged.
     */
    template <typename T>
    class CompletionQueue
    {
    public:
        class Outcome
        {
        public:
            static Outcome success(T value)
            {
                Outcome o;
                o.m_value = std::move(value);
                return o;
            }

            static Outcome failure(std::exception_ptr error)
            {
                Outcome o;
                o.m_error = std::move(error);
                return o;
            }

            bool failed() const noexcept { return static_cast<bool>(m_error); }

            /// The task's value, or rethrow the task's exception.
            T get()
            {
                if (m_error)
                {
                    std::rethrow_exception(m_error);
                }
                return std::move(*m_value);
            }

        private:
            std::optional<T>   m_value;
            std::exception_ptr m_error;
        };

        CompletionQueue() = default;

        CompletionQueue(const CompletionQueue &)            = delete;
        CompletionQueue &operator=(const CompletionQueue &) = delete;

        void push(Outcome outcome)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_ready.push_back(std::move(outcome));
            }
            m_cv.notify_one();
        }

        /// Block until an outcome is available.
        Outcome pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_ready.empty(); });
            Outcome outcome = std::move(m_ready.front());
            m_ready.pop_front();
            return outcome;
        }

        /**
         * Wrap fn so that running it pushes its outcome here.
         *
         * fn must be copyable (it is stored in a std::function) and return T.
         */
        template <typename Fn>
        auto wrap(Fn fn)
        {
            return [this, fn = std::move(fn)]() mutable {
                try
                {
                    push(Outcome::success(fn()));
                }
                catch (...)
                {
                    push(Outcome::failure(std::current_exception()));
                }
            };
        }

    private:
        std::deque<Outcome>     m_ready;
        std::mutex              m_mutex;
        std::condition_variable m_cv;
    };

} // namespace Pipeline
} // namespace IpSift
