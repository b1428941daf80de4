#ifndef TETHERLOCK_UI_CLI_TOKENIZER_HPP
#define TETHERLOCK_UI_CLI_TOKENIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace tetherlock::ui::cli
{

// Splits a shell line on whitespace. Single or double quotes group words ("My Headset");
// a backslash outside single quotes escapes the next character.
class Tokenizer
{
public:
    [[nodiscard]] static std::vector<std::string> tokenize(const std::string& line);

private:
    enum class Quote
    {
        None,
        Single,
        Double
    };

    struct Scan
    {
        std::vector<std::string> words;
        std::string word;
        bool inWord{ false };
        Quote quote{ Quote::None };
    };

    static void flush(Scan& scan);
    // Returns the number of characters consumed at `pos`.
    static std::size_t step(Scan& scan, const std::string& line, std::size_t pos);
};

} // namespace tetherlock::ui::cli

#endif // TETHERLOCK_UI_CLI_TOKENIZER_HPP
