// OntoUML model validator: loads a model, validates it, prints the results table.
#include <ontouml_loaders/example_model.hpp>
#include <ontouml_loaders/json_loader.hpp>
#include <ontouml_validation/diagnostic_sink.hpp>
#include <ontouml_validation/logger.hpp>
#include <ontouml_validation/validator.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>

namespace {

const char* usage =
    "usage: ontouml_validate [--errors|--no-errors] [--antipatterns|--no-antipatterns]\n"
    "                        [--log-level trace|debug|info|warn|error|off] [--log-file PATH]\n"
    "                        [--example] [MODEL.json]\n";

// Results table on stdout; highlight commands go to the log.
class TableSink : public ontouml_validation::DiagnosticSink {
public:
    explicit TableSink(const ontouml_model::Model& model)
        : model_(model)
    {
    }

    void highlight(ontouml_validation::ElementId element, ontouml_validation::Severity severity) override {
        ontouml_validation::validation_logger()->debug("highlight {} as {}",
            model_.uuid_of(element),
            severity == ontouml_validation::Severity::Error ? "invalid" : "warning");
    }

    void add_row(const ontouml_validation::ResultRow& row) override {
        (void)printf("%s\t%s\t%s (%s)\n", row.category.c_str(), row.text.c_str(),
            model_.uuid_of(row.element).c_str(), model_.label_of(row.element).c_str());
        ++rows_;
    }

    std::size_t rows() const { return rows_; }

private:
    const ontouml_model::Model& model_;
    std::size_t rows_ = 0;
};

std::optional<spdlog::level::level_enum> parse_level(const std::string& s) {
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warn") return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    if (s == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[])
{
    ontouml_validation::ValidationOptions options;
    std::string model_path;
    std::string log_file;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    bool use_example = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--errors") {
            options.check_errors = true;
        } else if (arg == "--no-errors") {
            options.check_errors = false;
        } else if (arg == "--antipatterns") {
            options.check_antipatterns = true;
        } else if (arg == "--no-antipatterns") {
            options.check_antipatterns = false;
        } else if (arg == "--example") {
            use_example = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = parse_level(argv[++i]);
            if (!level) {
                (void)fprintf(stderr, "unknown log level '%s'\n%s", argv[i], usage);
                return 2;
            }
            log_level = *level;
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            (void)fprintf(stdout, "%s", usage);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && model_path.empty()) {
            model_path = arg;
        } else {
            (void)fprintf(stderr, "unexpected argument '%s'\n%s", arg.c_str(), usage);
            return 2;
        }
    }

    auto logger = ontouml_validation::validation_logger();
    logger->set_level(log_level);
    if (!log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            logger->sinks().push_back(file_sink);
            logger->flush_on(spdlog::level::info);
        } catch (const spdlog::spdlog_ex& e) {
            (void)fprintf(stderr, "cannot open log file '%s': %s\n", log_file.c_str(), e.what());
            return 2;
        }
    }

    std::optional<ontouml_model::Model> model;
    if (!model_path.empty() && !use_example) {
        model = ontouml_loaders::load_model_from_json_file(model_path);
        if (!model) {
            (void)fprintf(stderr, "failed to load model '%s'\n", model_path.c_str());
            return 2;
        }
    } else {
        model = ontouml_loaders::generate_example_model();
    }
    logger->info("validating '{}' (errors={}, antipatterns={})",
        model->name, options.check_errors, options.check_antipatterns);

    const auto problems = ontouml_validation::validate(*model, options);

    TableSink sink(*model);
    ontouml_validation::report_problems(problems, sink);
    if (sink.rows() == 0) {
        (void)printf("No problems found\n");
        return 0;
    }
    logger->info("{} problems reported", sink.rows());
    return 1;
}
