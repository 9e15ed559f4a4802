#include "check.hpp"
#include "app_config.hpp"
#include "escape_time.hpp"

#include <string>
#include <vector>

static ConfigResult parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "fractal-studio");
    return parse_args(static_cast<int>(args.size()), args.data());
}

static bool has_warning(const ConfigResult& r, const std::string& text)
{
    for (const std::string& w : r.warnings)
        if (w.find(text) != std::string::npos) return true;
    return false;
}

static void test_defaults()
{
    std::printf("\nTest: defaults\n");

    const ConfigResult r = parse({});
    const AppConfig& c = r.config;
    check(r.warnings.empty(), "no arguments, no warnings");
    check(c.window_w == 1280 && c.window_h == 720, "default window 1280x720");
    check(c.fractal == FractalKind::Mandelbrot && c.iterations == 256, "default fractal and iterations");
    check(c.threads == 0 && c.log_level == spdlog::level::info, "default threads and log level");
    check(!c.headless() && !c.show_help, "interactive by default");
}

static void test_flags()
{
    std::printf("\nTest: flags\n");

    const ConfigResult r = parse({"--fractal", "sierpinski", "--iterations", "1000", "--size", "640x480",
                                  "--threads", "3", "--session", "s.json", "--verbose"});
    const AppConfig& c = r.config;
    check(r.warnings.empty(), "valid flags parse cleanly");
    check(c.fractal == FractalKind::Sierpinski, "--fractal");
    check(c.iterations == 1000, "--iterations");
    check(c.window_w == 640 && c.window_h == 480, "--size");
    check(c.threads == 3, "--threads");
    check(c.session_path == "s.json", "--session");
    check(c.log_level == spdlog::level::debug, "--verbose");

    const ConfigResult render = parse({"--render", "out.png"});
    check(render.config.render_path == "out.png" && render.config.headless(), "--render is headless");

    const ConfigResult bench = parse({"--benchmark"});
    check(bench.config.benchmark && bench.config.headless(), "--benchmark is headless");

    check(parse({"-h"}).config.show_help && parse({"--help"}).config.show_help, "help flags");
}

static void test_clamping()
{
    std::printf("\nTest: clamping and bad input\n");

    check(parse({"--iterations", "999999"}).config.iterations == MAX_ITERATIONS_CAP, "iterations clamp to the cap");
    check(parse({"--iterations", "-5"}).config.iterations == 1, "iterations clamp to 1");
    check(parse({"--threads", "100000"}).config.threads == 256, "threads clamp to 256");

    const AppConfig tiny = parse({"--size", "10x99999"}).config;
    check(tiny.window_w == 64 && tiny.window_h == 7680, "size clamps to 64..7680");

    const ConfigResult bad = parse({"--fractal", "burning-ship", "--iterations", "lots", "--size", "big"});
    check(bad.warnings.size() == 3, "one warning per bad value");
    check(has_warning(bad, "Invalid value for --fractal: 'burning-ship'"), "bad fractal reported");
    check(bad.config.fractal == FractalKind::Mandelbrot && bad.config.iterations == 256 &&
          bad.config.window_w == 1280, "bad values keep the defaults");

    const ConfigResult unknown = parse({"--fullscreen", "--fractal", "julia"});
    check(has_warning(unknown, "Unknown option ignored: --fullscreen"), "unknown flag reported");
    check(unknown.config.fractal == FractalKind::Julia, "parsing continues past an unknown flag");

    const ConfigResult missing = parse({"--iterations"});
    check(has_warning(missing, "Missing value for --iterations"), "missing value reported");
    check(missing.config.iterations == 256, "missing value keeps the default");
}

int main()
{
    std::printf("=== app config tests ===\n");
    test_defaults();
    test_flags();
    test_clamping();
    return report();
}
