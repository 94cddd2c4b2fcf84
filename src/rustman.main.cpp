#include <rustman/cli/run.hpp>
#include <rustman/util/env.hpp>
#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <neo/event.hpp>

#include <clocale>
#include <iostream>
#include <locale>

static void load_locale() {
    auto lang = rustman::getenv("LANG");
    if (!lang) {
        return;
    }
    try {
        std::locale::global(std::locale(*lang));
    } catch (const std::runtime_error& e) {
        rustman_log(debug, "Ignoring LANG='{}': {}", *lang, e.what());
        return;
    }
}

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    rustman::log::init_logger();
    neo::listener log_listener = &rustman::log::ev_log::print;
    load_locale();
    std::setlocale(LC_CTYPE, ".utf8");

    rustman::cancellation_flag cancel;
    rustman::install_signal_handlers(cancel);
    return rustman::cli::run(program_name, argv, cancel, std::cout, std::cerr);
}

int main(int argc, char** argv) { return main_fn(argv[0], {argv + 1, argv + argc}); }
