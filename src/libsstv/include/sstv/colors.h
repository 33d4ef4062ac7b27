#pragma once

#include <map>
#include <string>

#define RESET    "\033[0m"
#define RED      "\033[31m"
#define GREEN    "\033[32m"
#define YELLOW   "\033[33m"
#define BLUE     "\033[34m"
#define MAGENTA  "\033[35m"
#define CYAN     "\033[36m"
#define BOLDBLUE "\033[1m\033[34m"

/**
 * Palette of the interactive shell. Each theme ("prompt", "event", "reply")
 * is mapped to one palette colour and can be changed with `color`.
 */
class ColorManager {
public:
    static ColorManager& instance() {
        static ColorManager mgr;
        return mgr;
    }

    // Escape code of a theme, RESET for unknown themes
    const std::string& theme(const std::string& name) const {
        static const std::string reset = RESET;
        auto it = themes.find(name);
        return it != themes.end() ? it->second : reset;
    }

    bool set_theme_color(const std::string& name, const std::string& color_name) {
        auto color = palette.find(color_name);
        auto it = themes.find(name);
        if (color == palette.end() || it == themes.end()) {
            return false;
        }
        it->second = color->second;
        return true;
    }

    std::string list_colors() const {
        std::string result;
        for (const auto& [name, code] : palette) {
            result += std::string(code) + name + RESET + " ";
        }
        return result;
    }

    std::string list_theme() const {
        std::string result;
        for (const auto& [name, code] : themes) {
            result += name + "=" + code + "sample" + RESET + "\n";
        }
        return result;
    }

private:
    ColorManager()
        : palette{{"RED", RED}, {"GREEN", GREEN}, {"YELLOW", YELLOW}, {"BLUE", BLUE},
                  {"MAGENTA", MAGENTA}, {"CYAN", CYAN}, {"BOLDBLUE", BOLDBLUE}, {"RESET", RESET}},
          themes{{"prompt", BOLDBLUE}, {"event", GREEN}, {"reply", CYAN}} {
    }

    std::map<std::string, const char*> palette;
    std::map<std::string, std::string> themes;
};
