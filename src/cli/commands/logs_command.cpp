#include <deque>
#include <fstream>
#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>

namespace dsm::cli {

namespace {

void printTail(const std::filesystem::path& file, size_t lines) {
    std::ifstream in(file);
    if (!in) {
        std::cerr << "Cannot read " << file.string() << "\n";
        return;
    }
    std::deque<std::string> tail;
    std::string line;
    while (std::getline(in, line)) {
        tail.push_back(std::move(line));
        if (tail.size() > lines) {
            tail.pop_front();
        }
    }
    for (const auto& l : tail) {
        std::cout << l << "\n";
    }
}

} // namespace

class LogsCommand : public ICommand {
public:
    std::string getName() const override { return "logs"; }

    std::string getDescription() const override { return "Show the log files of a site"; }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("logs", getDescription());
        cmd->add_option("id", id_, "Site id")->required();
        cmd->add_option("-n,--lines", lines_, "Also print the last N lines of each file")
            ->check(CLI::NonNegativeNumber);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto files = cli_->getSiteManager().logFiles(id_);
        if (!files) {
            return files.error();
        }
        if (files.value().empty()) {
            std::cout << "No log files for site " << id_ << " yet\n";
            return Result<void>();
        }
        for (const auto& file : files.value()) {
            if (lines_ == 0) {
                std::cout << file.string() << "\n";
                continue;
            }
            std::cout << "==> " << file.string() << " <==\n";
            printTail(file, lines_);
        }
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
    std::string id_;
    size_t lines_ = 0;
};

std::unique_ptr<ICommand> createLogsCommand() {
    return std::make_unique<LogsCommand>();
}

} // namespace dsm::cli
