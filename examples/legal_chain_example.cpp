#include "api/temporal_engine.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>
#ifdef _WIN32
#include <direct.h>
#endif

using namespace tempo;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_ids(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        std::cout << "  - " << id << "\n";
    }
    if (ids.empty()) {
        std::cout << "  (none)\n";
    }
}

int main(int argc, char** argv) {
    print_separator("Temporal Graph Example - Contract Dispute");

    std::string config_path = argc > 1 ? argv[1] : "";

    EngineConfig config;
    try {
        config = load_config_with_fallback(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }
    config.analyzer.chunk_size_days = 60;

    const std::string output_dir = "output_json";
    #ifdef _WIN32
        _mkdir(output_dir.c_str());
    #else
        mkdir(output_dir.c_str(), 0755);
    #endif

    try {
        TemporalEngine engine(config);

        std::cout << "Adding documents...\n";
        engine.add_document("contract", "Supply contract signed with a delivery penalty clause",
                            "2024-01-05T09:00:00Z", {{"type", "contract"}});
        engine.add_document("amendment", "Amendment extends the delivery schedule by two weeks",
                            "2024-02-10", {{"type", "amendment"}});
        engine.add_document("notice", "Notice of late delivery sent to the supplier",
                            "2024-03-20T14:30:00+01:00", {{"type", "notice"}});
        engine.add_document("claim", "Penalty claim filed for late delivery under the contract",
                            "2024-04-02", {{"type", "claim"}});
        engine.add_document("response", "Supplier response disputing the penalty claim",
                            "2024-05-15", {{"type", "response"}});
        engine.add_document("mediation", "Mediation session on the delivery penalty dispute",
                            "2024-07-01", {{"type", "mediation"}});
        engine.add_document("settlement", "Settlement agreement closes the penalty dispute",
                            "2024-08-20", {{"type", "settlement"}});
        engine.add_document("newsletter", "Quarterly newsletter about office events",
                            "2024-04-10", {{"type", "other"}});

        std::cout << "Adding relationships...\n";
        engine.add_relationship("contract", "amendment", "sequential");
        engine.add_relationship("contract", "notice", "causal");
        engine.add_relationship("amendment", "notice", "sequential");
        engine.add_relationship("notice", "claim", "causal");
        engine.add_relationship("claim", "response", "causal");
        engine.add_relationship("response", "mediation", "causal");
        engine.add_relationship("mediation", "settlement", "causal");

        // Out-of-order filing: accepted, but flagged
        auto late = engine.add_relationship("settlement", "claim", "causal", 0.5);
        if (late.has_warning()) {
            std::cout << "  Warning: " << late.warning->message << "\n";
        }

        print_separator("Navigation");

        std::cout << "Documents after the claim:\n";
        print_ids(engine.get_future_documents("claim").documents);

        std::cout << "\nDocuments leading to the settlement:\n";
        print_ids(engine.get_past_documents("settlement").documents);

        auto path = engine.find_path("contract", "settlement");
        std::cout << "\nPath from contract to settlement (" << result_status_to_string(path.status) << "):\n";
        print_ids(path.path);

        print_separator("Attention");

        auto attention = engine.compute_attention("claim", 5);
        std::cout << std::left << std::setw(15) << "Document" << std::setw(10) << "Score"
                  << "Days" << "\n";
        std::cout << std::string(35, '-') << "\n";
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& entry : attention.backward) {
            std::cout << std::setw(15) << entry.id << std::setw(10) << entry.score
                      << entry.days_from_source << "\n";
        }
        for (const auto& entry : attention.forward) {
            std::cout << std::setw(15) << entry.id << std::setw(10) << entry.score
                      << entry.days_from_source << "\n";
        }
        std::cout << "\nForward balance: " << attention.balance() << "\n";

        print_separator("Windowed Analysis");

        auto analysis = engine.analyze_long_chain("contract", std::string("settlement"));
        analysis.print_summary();

        std::cout << "\nCausal chains:\n";
        for (const auto& chain : analysis.causal_chains) {
            std::cout << "  ";
            for (size_t i = 0; i < chain.documents.size(); ++i) {
                std::cout << chain.documents[i];
                if (i < chain.documents.size() - 1) std::cout << " -> ";
            }
            std::cout << "\n";
        }

        std::cout << "\nQuarterly summary:\n";
        for (const auto& window : engine.get_temporal_summary("contract", "settlement", 3)) {
            std::cout << "  " << window.period() << ": " << window.new_documents.size() << " documents, "
                      << window.causal_links << " causal links\n";
        }

        print_separator("Statistics");
        engine.get_statistics().print_summary();

        std::string json_path = output_dir + "/legal_chain.json";
        std::ofstream out(json_path);
        if (!out) {
            std::cerr << "Failed to open " << json_path << " for writing\n";
            return 1;
        }
        out << engine.export_graph().dump(2);
        std::cout << "\nExported graph to: " << json_path << "\n";

    } catch (const GraphError& e) {
        std::cerr << "Error [" << error_code_to_string(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
