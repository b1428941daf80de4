#include "Tokenizer.hpp"

#include <cctype>
#include <utility>

namespace tetherlock::ui::cli
{

std::vector<std::string> Tokenizer::tokenize(const std::string& line)
{
    Scan scan{};
    std::size_t pos{ 0 };
    while (pos < line.size())
    {
        pos += step(scan, line, pos);
    }

    flush(scan);
    return scan.words;
}

void Tokenizer::flush(Scan& scan)
{
    if (scan.inWord)
    {
        scan.words.push_back(std::move(scan.word));
    }
    scan.word.clear();
    scan.inWord = false;
}

std::size_t Tokenizer::step(Scan& scan, const std::string& line, std::size_t pos)
{
    const char c{ line[pos] };
    const bool hasNext{ pos + 1 < line.size() };

    switch (scan.quote)
    {
    case Quote::Single:
        if (c == '\'')
        {
            scan.quote = Quote::None;
        }
        else
        {
            scan.word.push_back(c);
        }
        return 1;

    case Quote::Double:
        if (c == '"')
        {
            scan.quote = Quote::None;
            return 1;
        }
        if (c == '\\' && hasNext && (line[pos + 1] == '"' || line[pos + 1] == '\\'))
        {
            scan.word.push_back(line[pos + 1]);
            return 2;
        }
        scan.word.push_back(c);
        return 1;

    case Quote::None:
        break;
    }

    if (std::isspace(static_cast<unsigned char>(c)) != 0)
    {
        flush(scan);
        return 1;
    }

    scan.inWord = true;
    if (c == '\'')
    {
        scan.quote = Quote::Single;
        return 1;
    }
    if (c == '"')
    {
        scan.quote = Quote::Double;
        return 1;
    }
    if (c == '\\' && hasNext)
    {
        scan.word.push_back(line[pos + 1]);
        return 2;
    }

    scan.word.push_back(c);
    return 1;
}

} // namespace tetherlock::ui::cli
