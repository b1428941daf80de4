#ifndef TETHERLOCK_UI_CLI_LINEREADER_HPP
#define TETHERLOCK_UI_CLI_LINEREADER_HPP

#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace tetherlock::ui::cli
{

// Reads lines on a helper thread so the caller can give up on a blocked read.
// The helper is detached: an abandoned read on std::cin may outlive the reader, so the stream
// must live until it returns (std::cin always does).
class LineReader final
{
public:
    enum class Status
    {
        Line,
        EndOfInput,
        Abandoned,
    };

    explicit LineReader(std::istream& in, std::chrono::milliseconds checkInterval = std::chrono::milliseconds{ 100 });

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;
    LineReader(LineReader&&) = delete;
    LineReader& operator=(LineReader&&) = delete;
    ~LineReader();

    // Waits for the next line, returning Abandoned once `keepWaiting` turns false.
    // After Abandoned, the next call resumes waiting for the same pending line.
    [[nodiscard]] Status next(std::string& line, const std::function<bool()>& keepWaiting);

private:
    struct Channel;

    void startWorker();

    std::istream* m_in{ nullptr };
    std::chrono::milliseconds m_checkInterval{};
    std::shared_ptr<Channel> m_channel;
    bool m_started{ false };
};

} // namespace tetherlock::ui::cli

#endif // TETHERLOCK_UI_CLI_LINEREADER_HPP
