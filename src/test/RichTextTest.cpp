#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/RichText.hpp"

using namespace docforge::domain;

int main() {
    std::cout << "[Test] Starting RichText Test..." << std::endl;

    {
        auto runs = ParseInlineRuns("plain text only");
        assert(runs.size() == 1);
        assert(runs[0].text == "plain text only");
        assert(!runs[0].bold && !runs[0].italic && !runs[0].code && !runs[0].strike);
    }

    {
        std::cout << "[Test] Bold, italic, strike and code spans..." << std::endl;
        auto runs = ParseInlineRuns("a **b** *c* ~~d~~ `e*f`");
        assert(runs.size() == 8);
        assert(runs[0].text == "a ");
        assert(runs[1].text == "b" && runs[1].bold);
        assert(runs[3].text == "c" && runs[3].italic && !runs[3].bold);
        assert(runs[5].text == "d" && runs[5].strike);
        assert(runs[7].text == "e*f" && runs[7].code);
    }

    {
        std::cout << "[Test] Nested emphasis..." << std::endl;
        auto runs = ParseInlineRuns("**bold _both_**");
        assert(runs.size() == 2);
        assert(runs[0].text == "bold " && runs[0].bold && !runs[0].italic);
        assert(runs[1].text == "both" && runs[1].bold && runs[1].italic);

        auto underscored = ParseInlineRuns("__strong__");
        assert(underscored.size() == 1);
        assert(underscored[0].bold);
        assert(underscored[0].text == "strong");
    }

    {
        std::cout << "[Test] Literal markers..." << std::endl;
        auto snake = ParseInlineRuns("my_var_name");
        assert(snake.size() == 1);
        assert(snake[0].text == "my_var_name");
        assert(!snake[0].italic);

        auto unclosed = ParseInlineRuns("**oops");
        assert(unclosed.size() == 1);
        assert(unclosed[0].text == "**oops");
        assert(!unclosed[0].bold);

        auto math = ParseInlineRuns("2 * 3 = 6");
        assert(math.size() == 1);
        assert(math[0].text == "2 * 3 = 6");
    }

    {
        std::cout << "[Test] Plain text extraction..." << std::endl;
        assert(PlainTextOf("**Total** is `42` and *rising*") == "Total is 42 and rising");
        assert(PlainTextOf("").empty());
        assert(ParseInlineRuns("").empty());
    }

    std::cout << "[PASS] RichText Test Passed." << std::endl;
    return 0;
}
