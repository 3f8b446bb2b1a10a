#include <textprobe/decoder.h>
#include <textprobe/encoding.h>
#include <textprobe/file_view.h>

#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk     = 0;
constexpr int kExitOpen   = 1;
constexpr int kExitConfig = 2;

struct InspectConfig {
    std::vector<std::string> files;
    std::vector<std::string> order;   // empty: default registry
    bool show_encoding = false;
    bool verbose = false;
};

void print_usage(std::FILE* out) {
    std::fprintf(out,
        "usage: textprobe-inspect [options] <file>...\n"
        "\n"
        "  -e, --show-encoding   print the accepted encoding before each file\n"
        "  -v, --verbose         log every candidate's verdict to stderr\n"
        "      --order a,b,...   try encodings in this order after utf-8\n"
        "  -h, --help            show this help\n");
}

std::vector<std::string> split_list(std::string_view list) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= list.size()) {
        std::size_t comma = list.find(',', start);
        if (comma == std::string_view::npos) comma = list.size();
        if (comma > start) out.emplace_back(list.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

// Returns false on a usage error (already reported).
bool parse_args(int argc, char* argv[], InspectConfig& config, bool& help) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            help = true;
        } else if (arg == "-e" || arg == "--show-encoding") {
            config.show_encoding = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--order") {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "textprobe: --order needs a value\n");
                return false;
            }
            config.order = split_list(argv[++i]);
        } else if (arg.starts_with("--order=")) {
            config.order = split_list(arg.substr(8));
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::fprintf(stderr, "textprobe: unknown option '%.*s'\n",
                         static_cast<int>(arg.size()), arg.data());
            return false;
        } else {
            config.files.emplace_back(arg);
        }
    }
    return true;
}

void log_attempts(const textprobe::FileView& view) {
    const std::string name = view.path().string();
    for (const auto& a : view.attempts()) {
        std::string_view enc = a.candidate->name;
        std::string_view verdict = textprobe::to_string(a.verdict);
        std::fprintf(stderr, "textprobe: %s: %.*s: %.*s\n", name.c_str(),
                     static_cast<int>(enc.size()), enc.data(),
                     static_cast<int>(verdict.size()), verdict.data());
    }
}

void print_view(const textprobe::FileView& view, bool show_encoding) {
    if (show_encoding) {
        std::string_view enc = view.encoding() ? view.encoding()->name : "binary";
        std::string hint = view.language_hint();
        std::printf("%s: %.*s (%s)\n", view.path().string().c_str(),
                    static_cast<int>(enc.size()), enc.data(), hint.c_str());
    }

    if (view.is_binary()) {
        std::printf("Binary files are not supported.\n");
        return;
    }

    const std::string& text = view.text();
    std::fwrite(text.data(), 1, text.size(), stdout);
    if (!text.empty() && text.back() != '\n') std::fputc('\n', stdout);
}

} // namespace

int main(int argc, char* argv[]) {
    InspectConfig config;
    bool help = false;
    if (!parse_args(argc, argv, config, help)) {
        print_usage(stderr);
        return kExitConfig;
    }
    if (help) {
        print_usage(stdout);
        return kExitOk;
    }
    if (config.files.empty()) {
        print_usage(stderr);
        return kExitConfig;
    }

    textprobe::FileViewConfig view_config;
    view_config.trace = config.verbose;
    try {
        if (!config.order.empty())
            view_config.order = textprobe::make_registry(config.order);
        textprobe::validate_registry(view_config.order.empty()
                                         ? textprobe::default_registry()
                                         : textprobe::Registry(view_config.order));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "textprobe: configuration error: %s\n", e.what());
        return kExitConfig;
    }

    int status = kExitOk;
    for (const auto& file : config.files) {
        textprobe::FileView view(view_config);
        try {
            view.open_file(file);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "textprobe: cannot open '%s': %s\n",
                         file.c_str(), e.what());
            status = kExitOpen;
            continue;
        }
        if (config.verbose) log_attempts(view);
        print_view(view, config.show_encoding);
    }
    return status;
}
