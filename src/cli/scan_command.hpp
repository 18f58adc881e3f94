#pragma once

#include "main_command.hpp"
#include "fluttersec/common/cancellation.hpp"
#include "fluttersec/core/pipeline.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <string>

namespace fluttersec {
namespace cli {

class ScanCommand : public MainCommand {
public:
    ScanCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

    bool validateArguments() const override;

private:
    std::string target_path_;
    std::string format_;
    std::string output_path_;
    std::string attack_sim_;
    std::string fail_on_;
    std::string work_dir_;
    bool keep_work_dir_ = false;
    bool verbose_ = false;
    bool parallel_ = false;

    common::CancellationToken cancel_;

    static std::atomic<ScanCommand*> instance_;
    static void signalHandlerStatic(int signal);
    void installSignalHandlers();
    void restoreSignalHandlers();

    std::string renderReport(const core::AuditReport& report, const std::string& format) const;
    bool writeOutput(const std::string& content) const;
    bool failThresholdMet(const common::AnalysisResult& result) const;
};

}}
