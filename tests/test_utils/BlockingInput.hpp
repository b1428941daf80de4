#ifndef TETHERLOCK_TESTS_TEST_UTILS_BLOCKINGINPUT_HPP
#define TETHERLOCK_TESTS_TEST_UTILS_BLOCKINGINPUT_HPP

#include <condition_variable>
#include <istream>
#include <mutex>
#include <streambuf>

namespace tetherlock::test_utils
{

// An input stream whose reads block until close(), like a terminal nobody types into.
class BlockingInput final : public std::istream
{
public:
    BlockingInput() : std::istream(&m_buffer)
    {
    }

    void close()
    {
        m_buffer.close();
    }

    void reopen()
    {
        m_buffer.reopen();
        clear();
    }

    [[nodiscard]] bool readerWaiting() const
    {
        return m_buffer.waiting();
    }

private:
    class Buffer final : public std::streambuf
    {
    public:
        void close()
        {
            {
                std::scoped_lock lock{ m_mutex };
                m_closed = true;
            }
            m_changed.notify_all();
        }

        void reopen()
        {
            std::scoped_lock lock{ m_mutex };
            m_closed = false;
        }

        [[nodiscard]] bool waiting() const
        {
            std::scoped_lock lock{ m_mutex };
            return m_waiting;
        }

    protected:
        int_type underflow() override
        {
            std::unique_lock lock{ m_mutex };
            m_waiting = true;
            m_changed.wait(lock, [this]() { return m_closed; });
            m_waiting = false;
            return traits_type::eof();
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_changed;
        bool m_closed{ false };
        bool m_waiting{ false };
    };

    Buffer m_buffer;
};

} // namespace tetherlock::test_utils

#endif // TETHERLOCK_TESTS_TEST_UTILS_BLOCKINGINPUT_HPP
