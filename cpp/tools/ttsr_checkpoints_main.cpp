#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "ttsr/checkpoint_store.h"
#include "ttsr/chunker.h"
#include "ttsr/config.h"
#include "ttsr/converter.h"
#include "ttsr/errors.h"

using json = nlohmann::json;

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

static json record_to_json(const ttsr::CheckpointRecord& r) {
    json j;
    j["run_key"] = r.run_key;
    j["document_path"] = r.document_path;
    j["content_hash"] = r.content_hash;
    j["total_chunks"] = r.total_chunks;
    j["completed_chunks"] = r.completed_chunks;
    j["failed_chunks"] = r.failed_chunks;
    j["artifact_paths"] = r.artifact_paths;
    j["output_path"] = r.output_path;
    j["language"] = r.language;
    j["slow"] = r.slow;
    j["status"] = ttsr::to_string(r.status);
    j["cumulative_processing_time"] = r.cumulative_processing_time;
    j["name_prefix"] = r.name_prefix;
    j["session_label"] = r.session_label;
    j["created_at_utc"] = r.created_at_utc;
    j["updated_at_utc"] = r.updated_at_utc;
    return j;
}

int main(int argc, char** argv) {
    std::string state_dir;
    std::string config_file;
    std::string cmd;
    std::string key;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--state-dir") state_dir = arg_value(i, argc, argv);
        else if (a == "--config") config_file = arg_value(i, argc, argv);
        else if (cmd.empty()) cmd = a;
        else if (key.empty()) key = a;
    }

    if (cmd != "list" && cmd != "validate" && cmd != "purge" && cmd != "purge-all") {
        std::cerr << "Usage: ttsr_checkpoints [--state-dir DIR] [--config FILE] list|validate|purge KEY|purge-all\n";
        return 1;
    }
    if (cmd == "purge" && key.empty()) {
        std::cerr << "purge needs a run key (see `list`)\n";
        return 1;
    }

    try {
        ttsr::Config cfg = ttsr::load_config(config_file);
        if (!state_dir.empty()) cfg.state_dir = state_dir;

        ttsr::CheckpointStore store(cfg.database_path());
        ttsr::Chunker chunker(cfg.boundaries_dir());

        json out;
        int rc = 0;

        if (cmd == "list") {
            out = json::array();
            for (const auto& r : store.list_all()) out.push_back(record_to_json(r));
        } else if (cmd == "validate") {
            bool all_ok = true;
            json recs = json::array();
            for (const auto& r : store.list_all()) {
                auto vr = ttsr::validate_record(r);
                all_ok = all_ok && vr.ok;
                recs.push_back({{"run_key", r.run_key}, {"ok", vr.ok}, {"errors", vr.errors}});
            }
            out["ok"] = all_ok;
            out["records"] = std::move(recs);
            rc = all_ok ? 0 : 2;
        } else if (cmd == "purge") {
            auto rec = store.load(key);
            const bool removed = store.purge(key);
            if (rec) chunker.remove_cache(rec->document_path);
            store.remove_database_if_empty();
            out["run_key"] = key;
            out["purged"] = removed;
        } else {
            const int64_t n = store.purge_all();
            const size_t caches = chunker.remove_all_caches();
            store.remove_database_if_empty();
            out["purged"] = n;
            out["boundary_caches"] = caches;
        }

        std::cout << out.dump() << "\n";
        return rc;
    } catch (const ttsr::TtsrException& e) {
        std::cerr << "ttsr_checkpoints failed: " << e.what() << "\n";
        return 2;
    }
}
