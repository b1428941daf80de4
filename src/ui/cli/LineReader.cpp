#include "LineReader.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace tetherlock::ui::cli
{

struct LineReader::Channel
{
    std::mutex mutex;
    std::condition_variable changed;
    bool requested{ false };  // a read is wanted and the worker has not picked it up yet
    bool outstanding{ false }; // a line has been asked for and not yet handed out
    bool closed{ false };     // the reader is gone; the worker exits after its current read
    bool endOfInput{ false };
    std::optional<std::string> line;
};

LineReader::LineReader(std::istream& in, std::chrono::milliseconds checkInterval)
    : m_in(&in), m_checkInterval(checkInterval), m_channel(std::make_shared<Channel>())
{
}

LineReader::~LineReader()
{
    {
        std::scoped_lock lock{ m_channel->mutex };
        m_channel->closed = true;
    }
    m_channel->changed.notify_all();
}

LineReader::Status LineReader::next(std::string& line, const std::function<bool()>& keepWaiting)
{
    if (!m_started)
    {
        startWorker();
    }

    std::unique_lock lock{ m_channel->mutex };
    if (!m_channel->outstanding && !m_channel->endOfInput)
    {
        m_channel->outstanding = true;
        m_channel->requested = true;
        m_channel->changed.notify_all();
    }

    while (!m_channel->line && !m_channel->endOfInput)
    {
        if (!keepWaiting())
        {
            return Status::Abandoned;
        }
        m_channel->changed.wait_for(lock, m_checkInterval);
    }

    if (m_channel->line)
    {
        line = std::move(*m_channel->line);
        m_channel->line.reset();
        m_channel->outstanding = false;
        return Status::Line;
    }
    return Status::EndOfInput;
}

void LineReader::startWorker()
{
    m_started = true;
    std::thread worker{ [channel = m_channel, in = m_in]()
                        {
                            for (;;)
                            {
                                {
                                    std::unique_lock lock{ channel->mutex };
                                    channel->changed.wait(lock,
                                                          [&channel]() { return channel->requested || channel->closed; });
                                    if (channel->closed)
                                    {
                                        return;
                                    }
                                    channel->requested = false;
                                }

                                std::string text;
                                const bool ok{ static_cast<bool>(std::getline(*in, text)) };

                                {
                                    std::scoped_lock lock{ channel->mutex };
                                    if (ok)
                                    {
                                        channel->line = std::move(text);
                                    }
                                    else
                                    {
                                        channel->endOfInput = true;
                                    }
                                }
                                channel->changed.notify_all();
                                if (!ok)
                                {
                                    return;
                                }
                            }
                        } };
    worker.detach();
}

} // namespace tetherlock::ui::cli
