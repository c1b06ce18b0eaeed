#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

/*
    Channel<T>

    Unbounded hand-off queue between one producer thread and one consumer.

      - Send() never blocks on a slow consumer.
      - Send() returns false once the Receiver has been destroyed; the value
        is dropped.
      - Recv() blocks until a value arrives, or returns nullopt once every
        Sender is gone and the queue is drained.
      - Values come out in the order they were sent.
*/

namespace swarmlink::core {

    namespace detail {
        template <typename T>
        struct ChannelState {
            std::mutex mtx;
            std::condition_variable cv;
            std::deque<T> queue;
            size_t senders = 0;
            bool receiver_alive = true;
        };
    }

    template <typename T>
    class Sender {
    public:
        Sender() = default;

        explicit Sender(std::shared_ptr<detail::ChannelState<T>> st)
            : m_State(std::move(st))
        {
            if (m_State) {
                std::lock_guard<std::mutex> lk(m_State->mtx);
                m_State->senders++;
            }
        }

        Sender(const Sender& o) : Sender(o.m_State) {}
        Sender(Sender&& o) noexcept : m_State(std::move(o.m_State)) {}

        Sender& operator=(Sender o) noexcept
        {
            std::swap(m_State, o.m_State);
            return *this;
        }

        ~Sender() { Release(); }

        bool Send(T value) const
        {
            if (!m_State) return false;
            {
                std::lock_guard<std::mutex> lk(m_State->mtx);
                if (!m_State->receiver_alive) return false;
                m_State->queue.push_back(std::move(value));
            }
            m_State->cv.notify_one();
            return true;
        }

        bool IsClosed() const
        {
            if (!m_State) return true;
            std::lock_guard<std::mutex> lk(m_State->mtx);
            return !m_State->receiver_alive;
        }

    private:
        void Release()
        {
            if (!m_State) return;
            {
                std::lock_guard<std::mutex> lk(m_State->mtx);
                m_State->senders--;
            }
            m_State->cv.notify_all();
            m_State.reset();
        }

        std::shared_ptr<detail::ChannelState<T>> m_State{};
    };

    template <typename T>
    class Receiver {
    public:
        explicit Receiver(std::shared_ptr<detail::ChannelState<T>> st)
            : m_State(std::move(st)) {}

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        Receiver(Receiver&&) noexcept = default;

        // Closes the channel this receiver held before taking over o's.
        Receiver& operator=(Receiver&& o) noexcept
        {
            if (this != &o) {
                Close();
                m_State = std::move(o.m_State);
            }
            return *this;
        }

        ~Receiver() { Close(); }

        std::optional<T> Recv()
        {
            if (!m_State) return std::nullopt;
            std::unique_lock<std::mutex> lk(m_State->mtx);
            m_State->cv.wait(lk, [this] { return !m_State->queue.empty() || m_State->senders == 0; });
            return PopLocked();
        }

        template <typename Rep, typename Period>
        std::optional<T> RecvFor(std::chrono::duration<Rep, Period> timeout)
        {
            if (!m_State) return std::nullopt;
            std::unique_lock<std::mutex> lk(m_State->mtx);
            m_State->cv.wait_for(lk, timeout, [this] { return !m_State->queue.empty() || m_State->senders == 0; });
            return PopLocked();
        }

        std::optional<T> TryRecv()
        {
            if (!m_State) return std::nullopt;
            std::lock_guard<std::mutex> lk(m_State->mtx);
            return PopLocked();
        }

    private:
        void Close()
        {
            if (!m_State) return;
            {
                std::lock_guard<std::mutex> lk(m_State->mtx);
                m_State->receiver_alive = false;
                m_State->queue.clear();
            }
            m_State.reset();
        }

        std::optional<T> PopLocked()
        {
            if (m_State->queue.empty()) return std::nullopt;
            std::optional<T> v(std::move(m_State->queue.front()));
            m_State->queue.pop_front();
            return v;
        }

        std::shared_ptr<detail::ChannelState<T>> m_State;
    };

    template <typename T>
    std::pair<Sender<T>, Receiver<T>> MakeChannel()
    {
        auto st = std::make_shared<detail::ChannelState<T>>();
        return { Sender<T>(st), Receiver<T>(st) };
    }

} // namespace swarmlink::core
