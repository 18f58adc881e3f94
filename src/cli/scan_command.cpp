#include "scan_command.hpp"
#include "fluttersec/common/config.hpp"
#include "fluttersec/common/logger.hpp"
#include "fluttersec/core/error_codes.hpp"
#include "fluttersec/format/console_formatter.hpp"
#include "fluttersec/format/html_formatter.hpp"
#include "fluttersec/format/json_formatter.hpp"
#include "fluttersec/format/markdown_formatter.hpp"
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fluttersec {
namespace cli {

std::atomic<ScanCommand*> ScanCommand::instance_{nullptr};

ScanCommand::ScanCommand() = default;

void ScanCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("file", target_path_, "APK or IPA file to audit")
               ->required()
               ->check(CLI::ExistingFile);
    subcommand->add_option("-f,--format", format_,
                          "Report format (default: from config)")
                          ->check(CLI::IsMember({"console", "json", "html", "markdown"}));
    subcommand->add_option("-o,--output", output_path_,
                          "Write the report to this file");
    subcommand->add_option("--attack-sim", attack_sim_,
                          "Show attack simulation detail for this attacker level")
                          ->check(CLI::IsMember({"beginner", "intermediate", "advanced"}));
    subcommand->add_option("--fail-on", fail_on_,
                          "Exit with code 2 when findings of this severity exist")
                          ->check(CLI::IsMember({"critical", "high", "medium"}));
    subcommand->add_option("--work-dir", work_dir_,
                          "Extraction directory (default: private temporary directory)");
    subcommand->add_flag("--keep-work-dir", keep_work_dir_,
                        "Do not delete the extraction directory");
    subcommand->add_flag("-v,--verbose", verbose_,
                        "Verbose output");
    subcommand->add_flag("-p,--parallel", parallel_,
                        "Run detectors in parallel");

    markCalledOn(subcommand);
}

bool ScanCommand::validateArguments() const {
    if (keep_work_dir_ && work_dir_.empty()) {
        std::cerr << "Warning: --keep-work-dir without --work-dir keeps a temporary directory\n";
    }
    return !target_path_.empty();
}

void ScanCommand::signalHandlerStatic(int) {
    auto* command = instance_.load();
    if (command) {
        command->cancel_.cancel();
    }
}

void ScanCommand::installSignalHandlers() {
    instance_.store(this);
    std::signal(SIGINT, &ScanCommand::signalHandlerStatic);
    std::signal(SIGTERM, &ScanCommand::signalHandlerStatic);
}

void ScanCommand::restoreSignalHandlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    instance_.store(nullptr);
}

int ScanCommand::execute() {
    if (!validateArguments()) {
        std::cerr << subcommand_->help() << std::endl;
        return 1;
    }

    auto& config = common::Config::instance().global();
    auto& logger = common::Logger::instance();

    if (verbose_) {
        logger.setLevel(common::LogLevel::DEBUG);
    }

    std::string format = format_.empty() ? config.report.default_format : format_;

    auto options = core::PipelineOptions::fromConfig(config);
    if (!work_dir_.empty()) {
        options.work_dir = work_dir_;
    }
    options.keep_work_dir = keep_work_dir_;
    options.parallel_detectors = options.parallel_detectors || parallel_;

    core::AuditReport report;
    installSignalHandlers();
    try {
        core::AuditPipeline pipeline(std::move(options), cancel_);
        report = pipeline.run(target_path_);
        restoreSignalHandlers();
    } catch (const core::PipelineError& e) {
        restoreSignalHandlers();
        logger.error("[Scan] Failed | file={} | code={} | {}", target_path_, e.codeString(),
                    common::formatContext(e.context()));
        std::cerr << "Error: " << e.what() << " (" << e.codeString() << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        restoreSignalHandlers();
        logger.error("[Scan] Failed | file={} | error={}", target_path_, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    format::ConsoleOptions console_options;
    console_options.verbose = verbose_;
    console_options.priority_limit = config.report.priority_limit;
    if (!attack_sim_.empty()) {
        console_options.attack_detail = common::parseAttackerLevel(attack_sim_);
    }

    if (format == "console") {
        if (!output_path_.empty()) {
            console_options.use_colors = false;
        }
        std::ostringstream console_out;
        format::ConsoleFormatter(console_options).format(report, console_out);
        if (output_path_.empty()) {
            std::cout << console_out.str();
        } else if (!writeOutput(console_out.str())) {
            return 1;
        }
    } else if (output_path_.empty()) {
        std::cout << renderReport(report, format) << std::endl;
    } else {
        format::ConsoleFormatter(console_options).format(report, std::cout);
        if (!writeOutput(renderReport(report, format))) {
            return 1;
        }
        std::cout << "\nReport saved to: " << output_path_ << std::endl;
    }

    if (failThresholdMet(report.result)) {
        std::cerr << "Build failed: Found " << fail_on_ << " severity issues" << std::endl;
        return 2;
    }
    return 0;
}

std::string ScanCommand::renderReport(const core::AuditReport& report, const std::string& format) const {
    size_t limit = common::Config::instance().global().report.priority_limit;

    if (format == "json") {
        return format::JsonFormatter::format(report).dump(2);
    }
    if (format == "html") {
        return format::HtmlFormatter(limit).format(report);
    }
    return format::MarkdownFormatter(limit).format(report);
}

bool ScanCommand::writeOutput(const std::string& content) const {
    std::ofstream file(output_path_, std::ios::binary | std::ios::trunc);
    if (!file) {
        common::Logger::instance().error("[Scan] Cannot open output | path={}", output_path_);
        std::cerr << "Error: cannot write report to " << output_path_ << std::endl;
        return false;
    }
    file << content;
    if (!file) {
        common::Logger::instance().error("[Scan] Write failed | path={}", output_path_);
        std::cerr << "Error: cannot write report to " << output_path_ << std::endl;
        return false;
    }
    common::Logger::instance().debug("[Scan] Report written | path={} | size={}",
                                    output_path_, common::formatBytes(content.size()));
    return true;
}

// Findings AT the requested severity; higher severities do not trigger it.
bool ScanCommand::failThresholdMet(const common::AnalysisResult& result) const {
    if (fail_on_.empty()) {
        return false;
    }
    auto severity = common::parseSeverity(fail_on_);
    if (!severity) {
        return false;
    }
    return result.countBySeverity()[*severity] > 0;
}

}}
