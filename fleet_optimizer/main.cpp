#include <iostream>
#include <fstream>
#include <chrono>
#include <string>
#include "config.hpp"
#include "optimizer.hpp"
#include "requests.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc != 4) {
        cerr << "Usage: " << argv[0] << " <config.yaml> <requests.json> <output.json>\n";
        return 1;
    }

    EngineConfig cfg;
    if (!load_config(argv[1], cfg)) {
        cerr << "Failed to load config from " << argv[1] << "\n";
        return 1;
    }

    cout << "Loaded config: ledger capacity " << cfg.ledger_capacity
         << ", max " << cfg.max_candidates << " stops within "
         << cfg.max_start_distance_km << " km per vehicle\n";

    ifstream f(argv[2]);
    if (!f) {
        cerr << "Failed to open requests file " << argv[2] << "\n";
        return 1;
    }

    json q;
    try {
        f >> q;
    } catch (const exception& e) {
        cerr << "Error parsing requests JSON: " << e.what() << "\n";
        return 1;
    }
    f.close();

    if (!q.contains("events") || !q["events"].is_array()) {
        cerr << "No events found in requests\n";
        return 1;
    }

    cout << "Loaded " << q["events"].size() << " requests\n";

    FleetOptimizer engine(cfg);
    json output;
    if (q.contains("meta")) output["meta"] = q["meta"];
    output["results"] = json::array();

    int failed = 0;
    auto start_total = chrono::high_resolution_clock::now();

    for (const auto& request : q["events"]) {
        auto start_time = chrono::high_resolution_clock::now();
        json result = process_request(engine, request);
        auto end_time = chrono::high_resolution_clock::now();

        if (result.contains("error")) {
            failed++;
            cerr << "Request " << result["id"].dump() << " " << result["status"].get<string>()
                 << ": " << result["error"].get<string>() << "\n";
        }

        result["processing_time"] = chrono::duration<double, milli>(end_time - start_time).count();
        output["results"].push_back(result);
    }

    auto end_total = chrono::high_resolution_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(end_total - start_total);

    cout << "Processed " << output["results"].size() << " requests in "
         << duration.count() << " ms (" << failed << " failed)\n";
    cout << "Runs recorded: " << engine.ledger().count() << "\n";

    ofstream out_file(argv[3]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[3] << "\n";
        return 1;
    }

    out_file << output.dump(2);
    out_file.close();

    cout << "Output written to " << argv[3] << "\n";

    return 0;
}
