#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "SecureCsvWriter.hpp"

using namespace scsv;

static bool loadRecords(const std::string& path, std::vector<Record>& out, std::string& err) {
    std::ifstream ifs(path);
    if (!ifs) { err = "Cannot open records file " + path; return false; }
    Record j = Record::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_array()) { err = path + ": expected a JSON array of objects"; return false; }
    for (auto& row : j) out.push_back(row);
    return true;
}

static std::vector<Record> sampleRecords() {
    std::vector<Record> rows;
    rows.push_back({{"name", "Alice"}, {"email", "alice@example.com"}, {"score", 95}});
    rows.push_back({{"name", "Bob"}, {"email", "bob@example.com"}, {"score", 87}});
    rows.push_back({{"name", "=SUM(A1:A10)"}, {"email", "test@example.com"}, {"score", 100}}); // neutralized on write
    return rows;
}

int main(int argc, char* argv[]) {
    std::string configPath = "config.sample.json";
    bool userProvidedConfig = false;
    std::string outputPath, inputPath, appendPath;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i+1 < argc) {
            configPath = argv[++i];
            userProvidedConfig = true;
        } else if ((a == "-o" || a == "--output") && i+1 < argc) {
            outputPath = argv[++i];
        } else if ((a == "-i" || a == "--input") && i+1 < argc) {
            inputPath = argv[++i];
        } else if ((a == "-a" || a == "--append") && i+1 < argc) {
            appendPath = argv[++i];
        } else if (a == "--help" || a == "-h") {
            std::cout << "Usage: SecureCsvDemo [-c config.json] [-o out.csv] [-i records.json] [-a append.json]\n"
                         "  -c, --config   Writer configuration JSON (default: config.sample.json if present)\n"
                         "  -o, --output   Target CSV path (overrides output_path in config)\n"
                         "  -i, --input    JSON array of records to write (default: built-in sample)\n"
                         "  -a, --append   JSON array of records to append afterwards (default: built-in sample)\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << " (see --help)" << std::endl;
            return 1;
        }
    }

    WriterConfig cfg;
    std::ifstream probe(configPath);
    if (probe.good() || userProvidedConfig) {
        std::string err;
        auto cfgOpt = ConfigLoader::loadFromFile(configPath, err);
        if(!cfgOpt){ std::cerr << "Config load error: " << err << std::endl; return 1; }
        cfg = *cfgOpt;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
    if (!outputPath.empty()) cfg.outputPath = outputPath;

    std::vector<Record> toWrite, toAppend;
    std::string err;
    if (inputPath.empty()) toWrite = sampleRecords();
    else if (!loadRecords(inputPath, toWrite, err)) { spdlog::error("{}", err); return 1; }
    if (appendPath.empty()) toAppend.push_back({{"name", "Charlie"}, {"email", "charlie@example.com"}, {"score", 92}});
    else if (!loadRecords(appendPath, toAppend, err)) { spdlog::error("{}", err); return 1; }

    SecureCsvWriter writer(cfg);
    auto res = writer.write(cfg.outputPath, toWrite);
    if (!res) { spdlog::error("Write failed [{}]: {}", toString(res.code), res.message); return 1; }
    std::cout << "Successfully wrote data to " << cfg.outputPath << std::endl;

    res = writer.append(cfg.outputPath, toAppend);
    if (!res) { spdlog::error("Append failed [{}]: {}", toString(res.code), res.message); return 1; }
    std::cout << "Successfully appended data to " << cfg.outputPath << std::endl;
    return 0;
}
