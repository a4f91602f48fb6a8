#include "app.hpp"
#include "cli_status.hpp"
#include "tui/render.hpp"
#include "tui/terminal.hpp"
#include <cstring>
#include <iostream>

static void print_usage() {
    std::cout << "Usage: karl-tui [options]\n"
              << "\n"
              << "Interactive editor for karl configuration.\n"
              << "\n"
              << "Options:\n"
              << "  --init               Run the first-time setup wizard\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Files:\n"
              << "  ~/.config/karl/karl.json   Global config\n"
              << "  ./.karl.json               Project config (saved to when present)\n"
              << "\n"
              << "Keys:\n"
              << "  Tab, 1-6       Switch section\n"
              << "  j/k, Enter     Move, open details\n"
              << "  /              Search\n"
              << "  n, e, d        New, edit, delete\n"
              << "  Ctrl-S         Save\n"
              << "  q              Quit\n";
}

int main(int argc, char* argv[]) try {
    bool init_mode = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--init") == 0) {
            init_mode = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    karltui::AppOptions options;
    options.init_mode = init_mode;
    karltui::Application app(std::move(options));

    {
        karltui::Terminal terminal;
        while (!app.should_quit()) {
            app.poll_cli_status();
            karltui::render(app);

            auto key = terminal.read_key(100);
            if (!key) continue;

            if (app.handle_key(*key) == karltui::Effect::RunLogin) {
                terminal.suspend();
                std::cout << "Starting karl login...\n" << std::flush;
                bool ok = karltui::run_cli_login();
                terminal.resume();
                app.login_complete(ok);
            }
        }
    }

    if (init_mode && !app.status_message().empty()) {
        std::cout << app.status_message() << "\n";
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
