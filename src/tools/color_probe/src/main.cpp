#include "core/log.hpp"
#include "color/color.hpp"
#include "color/gamut_map.hpp"
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "Usage: ce_color_probe [--json] [--gamut clip|local-minde] [--to <space>] "
                 "<space> <c0> <c1> <c2> [alpha]\n"
                 "Channels accept \"none\" for a missing component.\n";
}

// Returns false when `text` is neither a number nor "none".
bool parse_channel(const std::string& text, ce::color::Channel& out) {
    if(text == "none") { out = std::nullopt; return true; }
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if(used != text.size()) return false;
        out = v;
        return true;
    } catch(const std::invalid_argument&) {
        return false;
    } catch(const std::out_of_range&) {
        return false;
    }
}

std::string json_bool(bool v) { return v ? "true" : "false"; }

} // namespace

int main(int argc, char** argv) {
    using namespace ce::color;
    ce::log::init_from_env();

    if(argc < 2) { print_usage(); return 1; }

    bool json = false;
    std::string gamut_name(name(default_gamut_map_method));
    std::string to_name;
    std::vector<std::string> positional;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") { json = true; continue; }
        if(a == "--help" || a == "-h") { print_usage(); return 0; }
        if(a == "--gamut" || a == "--to") {
            if(i + 1 >= argc) { std::cerr << a << " requires a value." << std::endl; return 1; }
            (a == "--gamut" ? gamut_name : to_name) = argv[++i];
            continue;
        }
        positional.push_back(std::move(a));
    }
    if(positional.size() < 4 || positional.size() > 5) { print_usage(); return 1; }

    Channels channels;
    Channel alpha = 1.0;
    for(size_t i=1;i<positional.size();++i){
        Channel& slot = i < 4 ? channels[i - 1] : alpha;
        if(!parse_channel(positional[i], slot)) {
            std::cerr << "Invalid channel value \"" << positional[i] << "\"." << std::endl;
            return 1;
        }
    }

    auto space = color_space_from_name(positional[0]);
    if(!space) { ce::log::error(space.error().message); return 2; }
    auto method = gamut_map_method_from_name(gamut_name);
    if(!method) { ce::log::error(method.error().message); return 2; }
    ColorSpace dest = *space;
    if(!to_name.empty()) {
        auto to = color_space_from_name(to_name);
        if(!to) { ce::log::error(to.error().message); return 2; }
        dest = *to;
    }

    const Color input(*space, channels, alpha);
    const Color converted = input.to_space(dest);
    const bool in_gamut = converted.is_in_gamut();
    const Color mapped = converted.to_gamut(*method);

    if(json){
        std::ostringstream oss;
        oss << '{';
        oss << "\"input\":\"" << to_string(input) << "\",";
        oss << "\"space\":\"" << space_name(dest) << "\",";
        oss << "\"converted\":\"" << to_string(converted) << "\",";
        oss << "\"in_gamut\":" << json_bool(in_gamut) << ',';
        oss << "\"gamut_method\":\"" << name(*method) << "\",";
        oss << "\"mapped\":\"" << to_string(mapped) << "\"";
        oss << '}';
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "Input: " << to_string(input) << "\n";
        std::cout << "Converted: " << to_string(converted) << "\n";
        std::cout << "In gamut: " << (in_gamut ? "yes" : "no") << "\n";
        std::cout << "Mapped (" << name(*method) << "): " << to_string(mapped) << "\n";
    }
    return 0;
}
