#include "app_config.hpp"
#include "escape_time.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace {

constexpr int MIN_WINDOW = 64;
constexpr int MAX_WINDOW = 7680;

bool parse_int(const char* s, long& out)
{
    char* end = nullptr;
    out = std::strtol(s, &end, 10);
    return end != s && *end == '\0';
}

bool parse_size(const char* s, int& w, int& h)
{
    long a = 0, b = 0;
    char* end = nullptr;
    a = std::strtol(s, &end, 10);
    if (end == s || (*end != 'x' && *end != 'X')) return false;
    const char* rest = end + 1;
    b = std::strtol(rest, &end, 10);
    if (end == rest || *end != '\0') return false;
    w = static_cast<int>(std::clamp<long>(a, MIN_WINDOW, MAX_WINDOW));
    h = static_cast<int>(std::clamp<long>(b, MIN_WINDOW, MAX_WINDOW));
    return true;
}

bool takes_value(const std::string& flag)
{
    return flag == "--fractal" || flag == "--iterations" || flag == "--size" ||
           flag == "--threads" || flag == "--session"    || flag == "--render";
}

}  // namespace

ConfigResult parse_args(int argc, const char* const* argv)
{
    ConfigResult r;
    AppConfig&   c = r.config;

    auto bad_value = [&](const std::string& flag, const char* value) {
        r.warnings.push_back("Invalid value for " + flag + ": '" + value + "'");
    };

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            c.show_help = true;
            continue;
        }
        if (flag == "--benchmark") {
            c.benchmark = true;
            continue;
        }
        if (flag == "--verbose") {
            c.log_level = spdlog::level::debug;
            continue;
        }
        if (!takes_value(flag)) {
            r.warnings.push_back("Unknown option ignored: " + flag);
            continue;
        }
        if (i + 1 >= argc) {
            r.warnings.push_back("Missing value for " + flag);
            continue;
        }

        const char* v = argv[++i];
        long n = 0;
        if (flag == "--fractal") {
            if (!fractal_from_id(v, c.fractal)) bad_value(flag, v);
        } else if (flag == "--iterations") {
            if (parse_int(v, n))
                c.iterations = clamp_iterations(static_cast<int>(std::clamp<long>(n, 0, MAX_ITERATIONS_CAP)));
            else
                bad_value(flag, v);
        } else if (flag == "--size") {
            if (!parse_size(v, c.window_w, c.window_h)) bad_value(flag, v);
        } else if (flag == "--threads") {
            if (parse_int(v, n))
                c.threads = static_cast<int>(std::clamp<long>(n, 0, 256));
            else
                bad_value(flag, v);
        } else if (flag == "--session") {
            c.session_path = v;
        } else if (flag == "--render") {
            c.render_path = v;
        }
    }
    return r;
}

void print_usage(const char* prog)
{
    std::printf(
        "Usage: %s [options]\n"
        "\n"
        "  --fractal NAME     mandelbrot, julia, koch-curve, sierpinski, fractal-tree\n"
        "  --iterations N     maximum iterations (1..%d)\n"
        "  --size WxH         window or output size\n"
        "  --threads N        render threads, 0 = hardware concurrency\n"
        "  --session FILE     load a saved session at start\n"
        "  --render FILE      render one settled frame to FILE (.png or .jxl) and exit\n"
        "  --benchmark        print a render timing table and exit\n"
        "  --verbose          debug logging\n"
        "  --help             show this message\n",
        prog, MAX_ITERATIONS_CAP);
}
