#include <mailnorm/mailnorm.hpp>
#include <mailnorm/types.hpp>

#include <config.hpp>
#include <email_parser.hpp>
#include <mail_directory.hpp>

#include <fmt/core.h>
#include <scope_guard/scope_guard.hpp>

#include <fstream>

namespace {

void print_usage(const char* argv0) {
    fmt::print(stderr,
               "usage:\n"
               "  {0} detail <file>                      full record as JSON\n"
               "  {0} summary <file>                     summary record as JSON\n"
               "  {0} list [folder]                      summaries of every .msg file\n"
               "  {0} attachment <file> <name> <output>  write attachment bytes to <output>\n",
               argv0);
}

int run_detail(const mailnorm::email_parser_t& parser, const std::string& path) {
    auto email_or_err = parser.parse_detail(path);
    if (!email_or_err) {
        log_error("failed parsing '{}': {}", path, email_or_err.error());
        return 1;
    }
    fmt::print("{}\n", mailnorm::types::to_json(*email_or_err));
    return 0;
}

int run_summary(const mailnorm::email_parser_t& parser, const std::string& path) {
    auto summary_or_err = parser.parse_summary(path);
    if (!summary_or_err) {
        log_error("failed parsing '{}': {}", path, summary_or_err.error());
        return 1;
    }
    fmt::print("{}\n", mailnorm::types::to_json(*summary_or_err));
    return 0;
}

int run_list(const mailnorm::email_parser_t& parser, const std::filesystem::path& folder) {
    auto summaries = mailnorm::mail_directory::summarize_directory(parser, folder);
    fmt::print("{}\n", mailnorm::types::to_json(summaries));
    return 0;
}

int run_attachment(const mailnorm::email_parser_t& parser,
                   const mailnorm::config::config_t& cfg,
                   const std::string& path,
                   const std::string& name,
                   const std::string& output_path) {
    auto data = parser.extract_attachment(path, name);
    if (!data) {
        log_error("attachment '{}' not found in '{}'", name, path);
        return 1;
    }
    if (data->size() > cfg.max_attachment_size) {
        log_error("attachment '{}' is {} bytes, above the {} byte limit", name, data->size(),
                  cfg.max_attachment_size);
        return 1;
    }

    std::ofstream out(output_path, std::ios_base::out | std::ios_base::binary);
    if (!out.write(data->data(), data->size())) {
        log_error("failed writing '{}'", output_path);
        return 1;
    }
    log_info("wrote {} bytes to '{}'", data->size(), output_path);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    if (!mailnorm::initialize()) {
        log_error("failed initializing mailnorm");
        return 1;
    }
    auto finalize_guard = sg::make_scope_guard([] {
        if (!mailnorm::finalize()) {
            log_warning("failed finalizing mailnorm");
        }
    });

    const auto cfg = mailnorm::config::load_from_env();
    auto parser = mailnorm::make_email_parser();

    const std::string command = argv[1];
    if (command == "detail" && argc == 3) {
        return run_detail(*parser, argv[2]);
    } else if (command == "summary" && argc == 3) {
        return run_summary(*parser, argv[2]);
    } else if (command == "list" && argc <= 3) {
        return run_list(*parser, argc == 3 ? std::filesystem::path{argv[2]} : cfg.email_folder);
    } else if (command == "attachment" && argc == 5) {
        return run_attachment(*parser, cfg, argv[2], argv[3], argv[4]);
    }

    print_usage(argv[0]);
    return 2;
}
