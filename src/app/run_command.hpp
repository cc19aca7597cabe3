/**
 * @file run_command.hpp
 * @brief Команды CLI: расчёт по CSV и определение колонок
 */

#pragma once

#include "core/pipeline.hpp"
#include "io/run_config.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace geomech::app {

/**
 * @brief Параметры запуска из командной строки
 *
 * Незаданные значения берутся из файла конфигурации, затем по умолчанию.
 */
struct RunCommandOptions {
    std::filesystem::path input_path;
    std::optional<std::filesystem::path> config_path;
    model::ColumnMapping column_override;

    std::optional<char> delimiter;
    std::optional<char> decimal_separator;
    std::optional<std::string> encoding;

    std::optional<std::filesystem::path> results_path;    ///< --out
    std::optional<std::string> json_target;               ///< --json, "-" означает stdout
    std::optional<std::filesystem::path> report_dir;      ///< --report

    std::optional<std::vector<model::DerivedField>> track_fields;
    std::optional<int> smoothing_window;
    bool normalize_tracks = false;
    std::optional<std::filesystem::path> tracks_path;     ///< --tracks-out

    bool quiet = false;
    bool detect_only = false;                             ///< --detect-columns
    bool show_help = false;
    bool show_version = false;

    /// Результаты идут в stdout (нет --out и --json, либо --json -)
    [[nodiscard]] bool dataToStdout() const noexcept {
        return (json_target && *json_target == "-") || (!json_target && !results_path);
    }
};

struct RunCommandResult {
    int exit_code = 1;
    std::string error_message;
    core::PipelineStats stats;
};

/**
 * @brief Разбор аргументов командной строки (без argv[0])
 * @throws std::invalid_argument Неизвестный ключ или неверное значение
 */
[[nodiscard]] RunCommandOptions parseRunArguments(const std::vector<std::string>& args);

/**
 * @brief Конфигурация: файл --config с наложением ключей командной строки
 * @throws io::ConfigError
 */
[[nodiscard]] io::RunConfig resolveRunConfig(const RunCommandOptions& options);

/**
 * @brief Расчёт по CSV с записью выбранных результатов
 *
 * Ошибки не выбрасываются: сообщение уходит в err, код возврата 1.
 * В режиме --json ошибка записывается и как {"error": ...}.
 */
RunCommandResult runCommand(const RunCommandOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Предложенный маппинг колонок и множители единиц
 */
RunCommandResult runDetectColumns(const RunCommandOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Текст справки
 */
[[nodiscard]] std::string usageText();

} // namespace geomech::app
