#ifndef TETHERLOCK_UI_CLI_INTERACTIVESHELL_HPP
#define TETHERLOCK_UI_CLI_INTERACTIVESHELL_HPP

#include "LineReader.hpp"
#include "tetherlock/core/PollLoop.hpp"

#include <iostream>
#include <string>

namespace tetherlock::ui::cli
{

// Operator console for a running PollLoop. Commands are applied on the loop thread and
// their result printed once the loop has run them.
class InteractiveShell final
{
public:
    InteractiveShell(tetherlock::core::PollLoop& loop, std::istream& in, std::ostream& out);

    // Returns when the operator exits, input ends, or the loop stops on its own. A loop that stops
    // while the prompt waits for input ends the shell without waiting for the operator.
    int run();

private:
    tetherlock::core::PollLoop& m_loop;
    LineReader m_in;
    std::ostream& m_out;
    bool m_running{ true };

    void processLine(const std::string& line);

    void doDevices();
    void doSelect(const std::string& target);
    void doDisable();
    void doTimeout(int seconds);
    void doStatus();

    template <class Fn> auto apply(Fn&& fn);
};

} // namespace tetherlock::ui::cli

#endif // TETHERLOCK_UI_CLI_INTERACTIVESHELL_HPP
