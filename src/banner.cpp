#include "banner.hpp"
#include "utils.hpp"

#include <algorithm>

namespace NetcapSetup {

    namespace {
        const std::size_t MIN_INNER_WIDTH = 42;
        const std::size_t TITLE_INDENT    = 5;

        std::string repeat(const std::string& piece, std::size_t count)
        {
            std::string result;
            for (std::size_t i = 0; i < count; ++i) {
                result += piece;
            }
            return result;
        }
    }

    void Banner::printHeader(std::ostream& out, const std::string& title) {
        std::size_t titleWidth = displayWidth(title);
        std::size_t inner = std::max(MIN_INNER_WIDTH, TITLE_INDENT + titleWidth + 1);

        out << "\n"
            << "  ╔" << repeat("═", inner) << "╗\n"
            << "  ║" << std::string(TITLE_INDENT, ' ') << title
            << std::string(inner - TITLE_INDENT - titleWidth, ' ') << "║\n"
            << "  ╚" << repeat("═", inner) << "╝\n"
            << "\n";
    }

    void Banner::printProgress(std::ostream& out, const std::string& description) {
        out << "  [*] " << description << "\n";
    }

    void Banner::printCompletion(std::ostream& out, const std::string& nextCommand) {
        out << "\n"
            << "  [✓] Installation complete!\n"
            << "\n"
            << "  Run with:\n"
            << "    " << nextCommand << "\n"
            << "\n";
        out.flush();
    }

}
