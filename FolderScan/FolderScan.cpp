#include <iostream>
#include <string>
#include <vector>

#include "FileScanner.hpp"
#include "Logger.hpp"
#include "TreePrinter.hpp"

namespace fs = std::filesystem;

namespace
{
    const char* SCAN_MODE = "scan";
    const char* TREE_MODE = "tree";
} //anonymous namespace

void printHelp()
{
    std::cout << "Usage: FolderScan [--verbose] [--log <file>] scan <folder> [algorithm]\n"
        << "       FolderScan [--verbose] [--log <file>] tree <folder>\n";
}

void printEntry(const FileEntry& entry)
{
    std::cout << entryTypeToString(entry.type) << '\t'
        << entry.permissions << '\t'
        << (entry.size ? std::to_string(*entry.size) : std::string("-")) << '\t'
        << (entry.checksum ? *entry.checksum : std::string("-")) << '\t'
        << (entry.extension ? *entry.extension : std::string("-")) << '\t'
        << entry.relativePath << '\n';
}

int main(int argc, char** argv)
{
    std::string logFile;
    LogLevel level = LogLevel::Info;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        if ("--verbose" == arg)
        {
            level = LogLevel::Debug;
        }
        else if ("--log" == arg && i + 1 < argc)
        {
            logFile = argv[++i];
        }
        else
        {
            args.push_back(arg);
        }
    }

    if (2u > args.size())
    {
        printHelp();
        return 1;
    }

    Logger::instance().init(logFile, level);

    const std::string& mode = args[0];
    fs::path folder = args[1];

    if (SCAN_MODE == mode)
    {
        ScanOptions options;
        if (2u < args.size())
        {
            options.algorithm = args[2];
        }

        FileScanner scanner(options);
        auto entries = scanner.buildTree(folder);
        if (!entries)
        {
            return 1;
        }

        for (const FileEntry& entry : *entries)
        {
            printEntry(entry);
        }

        if (!scanner.diagnostics().empty())
        {
            LOG(Info, "%zu recoverable problems during scan.", scanner.diagnostics().size());
        }
    }
    else if (TREE_MODE == mode)
    {
        TreePrinter printer;
        std::cout << printer.render(folder);
    }
    else
    {
        std::cout << "Unknown mode: " << mode << "\n";
        printHelp();
        return 1;
    }

    return 0;
}
