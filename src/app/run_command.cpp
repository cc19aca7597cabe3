/**
 * @file run_command.cpp
 * @brief Реализация команд CLI
 */

#include "run_command.hpp"
#include "core/diagnostics.hpp"
#include "core/errors.hpp"
#include "core/log_tracks.hpp"
#include "core/unit_normalizer.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/diagnostics_writer.hpp"
#include "io/file_utils.hpp"
#include "io/results_json.hpp"
#include <algorithm>
#include <cctype>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace geomech::app {

namespace {

using namespace geomech::model;

std::string describeChar(char c) {
    if (c == '\t') return "\\t";
    return std::string(1, c);
}

std::optional<std::string_view> labelView(const std::optional<std::string>& label) {
    if (!label) return std::nullopt;
    return std::string_view(*label);
}

std::vector<DerivedField> parseFieldList(const std::string& list) {
    std::vector<DerivedField> fields;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto field = derivedFieldFromName(item);
        if (!field) {
            throw std::invalid_argument("Неизвестное поле: " + item);
        }
        fields.push_back(*field);
    }
    if (fields.empty()) {
        throw std::invalid_argument("Пустой список полей --tracks");
    }
    return fields;
}

int parseWindow(const std::string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Неверное окно сглаживания: " + text);
    }
    if (pos != text.size() || value < 0) {
        throw std::invalid_argument("Неверное окно сглаживания: " + text);
    }
    return value;
}

std::string normalizeEncoding(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "UTF8") upper = "UTF-8";
    if (upper == "WINDOWS-1251") upper = "CP1251";
    if (upper != "UTF-8" && upper != "CP1251" && upper != "AUTO") {
        throw std::invalid_argument("Неподдерживаемая кодировка: " + text);
    }
    return upper;
}

void writeJsonEnvelope(const nlohmann::ordered_json& envelope, const std::string& target, std::ostream& out) {
    if (target == "-") {
        out << envelope.dump(2) << std::endl;
    } else {
        io::atomicWrite(target, envelope.dump(2) + "\n");
    }
}

void printMapping(std::ostream& out, const ColumnMapping& mapping, const ColumnMapping& detected) {
    for (auto field : kCanonicalFields) {
        const auto& header = mapping.get(field);
        out << "  " << canonicalFieldName(field) << ": ";
        if (!header || header->empty()) {
            out << "не найдено\n";
            continue;
        }
        out << '"' << *header << "\" ×"
            << core::unitMultiplier(labelView(header), unitKindFor(field));
        if (header != detected.get(field)) {
            out << " (задано вручную)";
        }
        out << '\n';
    }
}

void printSummary(
    std::ostream& out,
    const RunCommandOptions& options,
    const model::RawTable& table,
    const core::PipelineResult& result
) {
    const auto& stats = result.stats;
    out << "Файл: " << table.source_name << '\n';
    out << "Колонки:\n";
    printMapping(out, result.mapping, result.detected_mapping);
    out << "Строк: " << stats.rows_scanned
        << ", принято: " << stats.rows_accepted
        << ", отброшено: " << stats.rows_discarded << '\n';

    bool any_sentinel = false;
    for (auto field : kDerivedFieldOrder) {
        if (stats.sentinelCount(field) == 0) continue;
        out << (any_sentinel ? ", " : "Вырожденные значения: ")
            << derivedFieldName(field) << " = " << stats.sentinelCount(field);
        any_sentinel = true;
    }
    if (any_sentinel) out << '\n';

    if (options.results_path) out << "Результаты: " << options.results_path->string() << '\n';
    if (options.json_target) out << "JSON: " << *options.json_target << '\n';
    if (options.tracks_path) out << "Треки: " << options.tracks_path->string() << '\n';
    if (options.report_dir) out << "Отчёт: " << options.report_dir->string() << '\n';
}

/// Запись {"error"} и отчёта об ошибке; сбой записи сообщается в err
void writeFailureOutputs(
    const RunCommandOptions& options,
    const std::string& message,
    std::ostream& out,
    std::ostream& err
) {
    if (options.json_target) {
        try {
            writeJsonEnvelope(io::errorEnvelope(message), *options.json_target, out);
        } catch (const std::exception& e) {
            err << "Не удалось записать JSON: " << e.what() << std::endl;
        }
    }

    if (options.report_dir) {
        try {
            core::DiagnosticsOptions diag;
            diag.source_name = options.input_path.filename().string();
            auto report = core::buildFailureReport(message, diag);
            (void)io::writeDiagnosticsReports(report, *options.report_dir);
        } catch (const std::exception& e) {
            err << "Не удалось записать отчёт: " << e.what() << std::endl;
        }
    }
}

} // namespace

RunCommandOptions parseRunArguments(const std::vector<std::string>& args) {
    RunCommandOptions options;
    bool has_input = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Ключ " + arg + " требует значение");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "--detect-columns") {
            options.detect_only = true;
            options.input_path = next();
            has_input = true;
        } else if (arg == "--config") {
            options.config_path = std::filesystem::path(next());
        } else if (arg == "--depth-col") {
            options.column_override.depth = next();
        } else if (arg == "--density-col") {
            options.column_override.density = next();
        } else if (arg == "--vp-col") {
            options.column_override.vp = next();
        } else if (arg == "--vs-col") {
            options.column_override.vs = next();
        } else if (arg == "--delimiter") {
            const auto& value = next();
            options.delimiter = io::parseDelimiterName(value);
            if (!options.delimiter) {
                throw std::invalid_argument("Неверный разделитель: " + value);
            }
        } else if (arg == "--decimal") {
            const auto& value = next();
            if (value != "." && value != ",") {
                throw std::invalid_argument("Десятичный разделитель должен быть '.' или ','");
            }
            options.decimal_separator = value.front();
        } else if (arg == "--encoding") {
            options.encoding = normalizeEncoding(next());
        } else if (arg == "--out") {
            options.results_path = std::filesystem::path(next());
        } else if (arg == "--json") {
            options.json_target = next();
        } else if (arg == "--report") {
            options.report_dir = std::filesystem::path(next());
        } else if (arg == "--tracks") {
            options.track_fields = parseFieldList(next());
        } else if (arg == "--smooth") {
            options.smoothing_window = parseWindow(next());
        } else if (arg == "--normalize") {
            options.normalize_tracks = true;
        } else if (arg == "--tracks-out") {
            options.tracks_path = std::filesystem::path(next());
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (!arg.empty() && arg.front() == '-' && arg != "-") {
            throw std::invalid_argument("Неизвестный ключ: " + arg);
        } else if (!has_input) {
            options.input_path = std::filesystem::path(arg);
            has_input = true;
        } else {
            throw std::invalid_argument("Лишний аргумент: " + arg);
        }
    }

    if (!has_input && !options.show_help && !options.show_version) {
        throw std::invalid_argument("Не задан входной файл");
    }
    return options;
}

io::RunConfig resolveRunConfig(const RunCommandOptions& options) {
    io::RunConfig config;
    if (options.config_path) {
        config = io::loadRunConfig(*options.config_path);
    }

    config.columns.overrideWith(options.column_override);

    if (options.delimiter) config.csv.delimiter = options.delimiter;
    if (options.decimal_separator) config.csv.decimal_separator = options.decimal_separator;
    if (options.encoding) config.csv.encoding = *options.encoding;

    if (options.track_fields) config.tracks.fields = *options.track_fields;
    if (options.smoothing_window) config.tracks.smoothing_window = *options.smoothing_window;
    if (options.normalize_tracks) config.tracks.normalize = true;

    return config;
}

RunCommandResult runCommand(const RunCommandOptions& options, std::ostream& out, std::ostream& err) {
    RunCommandResult result;
    const bool verbose = !options.quiet && !options.dataToStdout();

    try {
        const auto config = resolveRunConfig(options);
        const auto table = io::readCsvTable(options.input_path, config.csv);

        core::PipelineOptions pipeline_options;
        pipeline_options.column_override = config.columns;
        const auto pipeline = core::runPipeline(table, pipeline_options);
        result.stats = pipeline.stats;

        if (options.results_path) {
            io::writeCsvResults(pipeline.samples, *options.results_path, config.export_options);
        }
        if (options.json_target) {
            writeJsonEnvelope(io::resultsEnvelope(pipeline.samples), *options.json_target, out);
        } else if (!options.results_path) {
            out << io::buildCsvResults(pipeline.samples, config.export_options);
        }

        if (options.tracks_path) {
            auto tracks = core::buildTracks(pipeline.samples, config.tracks);
            io::writeCsvTracks(tracks, *options.tracks_path, config.export_options);
        }

        if (options.report_dir) {
            core::DiagnosticsOptions diag;
            diag.source_name = table.source_name;
            auto report = core::buildRunReport(pipeline, diag);
            (void)io::writeDiagnosticsReports(report, *options.report_dir);
        }

        if (verbose) {
            printSummary(out, options, table, pipeline);
        }
        result.exit_code = 0;
    } catch (const std::exception& e) {
        result.error_message = e.what();
        err << "Ошибка: " << e.what() << std::endl;
        writeFailureOutputs(options, result.error_message, out, err);
    }

    return result;
}

RunCommandResult runDetectColumns(const RunCommandOptions& options, std::ostream& out, std::ostream& err) {
    RunCommandResult result;

    io::RunConfig config;
    try {
        config = resolveRunConfig(options);
    } catch (const std::exception& e) {
        result.error_message = e.what();
        err << "Ошибка: " << result.error_message << std::endl;
        return result;
    }

    auto detection = io::detectCsvFormat(options.input_path, config.csv);
    if (detection.header_names.empty()) {
        result.error_message = detection.diagnostics.empty()
            ? std::string("Не удалось прочитать заголовок")
            : detection.diagnostics.front();
        err << "Ошибка: " << result.error_message << std::endl;
        return result;
    }

    core::PipelineOptions pipeline_options;
    pipeline_options.column_override = config.columns;
    const auto mapping = core::resolveColumnMapping(detection.header_names, pipeline_options);

    out << "Кодировка: " << detection.detected_encoding
        << ", разделитель: '" << describeChar(detection.detected_delimiter)
        << "', десятичный: '" << detection.detected_decimal << "'\n";
    out << "Колонок: " << detection.column_count << '\n';
    for (const auto& header : detection.header_names) {
        out << "  - " << header << '\n';
    }
    out << "Предложенный маппинг:\n";
    printMapping(out, mapping, detection.suggested_mapping);

    auto missing = mapping.missingFields();
    if (!missing.empty()) {
        core::MissingColumnsError error(missing);
        result.error_message = error.what();
        err << "Ошибка: " << result.error_message << std::endl;
        return result;
    }

    result.exit_code = 0;
    return result;
}

std::string usageText() {
    return
        "Использование:\n"
        "  geomech <input.csv> [опции]\n"
        "  geomech --detect-columns <input.csv> [--config ...] [--depth-col ...]\n"
        "\n"
        "Колонки и чтение CSV:\n"
        "  --config <file.json>          Файл конфигурации\n"
        "  --depth-col <заголовок>       Колонка глубины\n"
        "  --density-col <заголовок>     Колонка плотности\n"
        "  --vp-col <заголовок>          Колонка Vp\n"
        "  --vs-col <заголовок>          Колонка Vs\n"
        "  --delimiter <c|tab|comma|semicolon|pipe>\n"
        "  --decimal <.|,>\n"
        "  --encoding <UTF-8|CP1251|AUTO>\n"
        "\n"
        "Вывод (без --out и --json результаты печатаются в stdout в CSV):\n"
        "  --out <results.csv>           Результаты в CSV\n"
        "  --json <file|->               Результаты в JSON-конверте\n"
        "  --report <dir>                report.json и report.md\n"
        "  --tracks <f1,f2,...>          Поля треков\n"
        "  --smooth <n>                  Окно скользящего среднего\n"
        "  --normalize                   Нормировать треки к [0;1]\n"
        "  --tracks-out <file.csv>       Треки в CSV\n"
        "  --quiet                       Без сводки\n"
        "  --version, --help\n";
}

} // namespace geomech::app
