#pragma once

/**
 * @file Banner.hpp
 * @brief Splash screen and section headers for console reports
 */

#include <cstddef>
#include <string>

namespace bioslurry {

/**
 * @brief Static text banners, all 80 columns wide
 */
class Banner {
  public:
    static constexpr std::size_t kWidth = 80;

    /// Startup splash with version and scenario name
    [[nodiscard]] static std::string GetSplashScreen(const std::string &version,
                                                     const std::string &scenario) {
        // clang-format off
        return "\n" + GetRule() + "\n" +
               "#" + std::string(kWidth - 2, ' ') + "#\n" +
               Framed("BIOSLURRY  |  glyphosate / AMPA bioslurry reactor simulator") +
               Framed("VER: " + version + "  |  SCENARIO: " + scenario) +
               "#" + std::string(kWidth - 2, ' ') + "#\n" +
               GetRule() + "\n";
        // clang-format on
    }

    /// "─── [ TITLE ] ─────..." padded to the full width
    [[nodiscard]] static std::string GetSectionHeader(const std::string &title) {
        const std::string lead = "[ " + title + " ] ";
        std::string header = "─── " + lead;
        for (std::size_t used = 4 + lead.size(); used < kWidth; ++used) {
            header += "─";
        }
        return header;
    }

    /// Header opening the end-of-run report
    [[nodiscard]] static std::string GetReportHeader() {
        return "\n" + GetRule() + "\n  RUN REPORT\n" + GetRule();
    }

    [[nodiscard]] static std::string GetRule(std::size_t width = kWidth, char c = '=') {
        return std::string(width, c);
    }

  private:
    /// "#    text    ...#" line, truncated if text is too long
    [[nodiscard]] static std::string Framed(const std::string &text) {
        const std::size_t inner = kWidth - 2 - 4;
        std::string body = text.substr(0, inner);
        body += std::string(inner - body.size(), ' ');
        return "#    " + body + "#\n";
    }
};

} // namespace bioslurry
