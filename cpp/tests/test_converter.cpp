#include <algorithm>
#include <cassert>
#include <cmath>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"
#include "ttsr/checkpoint_store.h"
#include "ttsr/converter.h"
#include "ttsr/document.h"
#include "ttsr/shutdown.h"

static fs::path sub(const fs::path& root, const char* name) {
    const fs::path p = root / name;
    fs::create_directories(p);
    return p;
}

static fs::path make_doc(const fs::path& root, const std::string& name, size_t chars) {
    const fs::path p = root / name;
    write_file(p, words_text(chars));
    return p;
}

// 100-char chunks, one worker: "abcd " * 20 per chunk
static ttsr::Config small_config(const fs::path& root) {
    ttsr::Config c = test_config(root);
    c.chunk_size = 100;
    c.parallel_enabled = false;
    return c;
}

static std::string key_for(const fs::path& doc, const std::string& label = "") {
    return ttsr::derive_run_key(ttsr::normalize_document_path(doc), label);
}

static void test_end_to_end(const fs::path& root) {
    ttsr::Config cfg = test_config(root);
    cfg.keep_completed_records = true;
    const fs::path doc = make_doc(root, "book.txt", 12000);

    FakeSynthesizer synth;
    MemorySink sink;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, &sink);

    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(!rep.resumed);
    assert(rep.total == 3);
    assert(rep.completed == 3);
    assert(rep.failed.empty());
    assert(rep.prefix == "book");
    assert(rep.artifacts.size() == 3);
    assert(synth.calls.load() == 3);

    const fs::path out = fs::path(rep.output_dir);
    assert(out.is_absolute());
    assert(out.filename() == "book");
    for (int i = 1; i <= 3; ++i) {
        const fs::path a = out / ("book " + std::to_string(i) + ".mp3");
        assert(fs::exists(a));
        assert(read_file(a).rfind("AUDIO:abcd", 0) == 0);
    }

    auto rec = conv.store().load(rep.run_key);
    assert(rec.has_value());
    assert(rec->status == ttsr::RunStatus::Completed);
    assert(rec->completed_chunks == 3);
    assert(!conv.store().load_incomplete(rep.run_key).has_value());
    assert(!conv.find_incomplete(doc, "").has_value());
    assert(!fs::exists(conv.chunker().cache_path(ttsr::normalize_document_path(doc))));
    assert(ctl.state() == ttsr::RunState::Running);
    assert(!ctl.processing_started());
}

static void test_completed_record_dropped_by_default(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "short.txt", 300);

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);

    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(rep.total == 3);
    assert(!conv.store().load(rep.run_key).has_value());
    assert(!fs::exists(cfg.database_path()));
}

static void test_resume_skips_finished_chunks(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "resume.txt", 500);

    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "resume 3.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::ForceStopped);
        assert(rep.total == 5);
        assert(rep.completed == 2);
        assert(ctl.state() == ttsr::RunState::Stopped);

        auto rec = conv.find_incomplete(doc, "");
        assert(rec.has_value());
        assert(rec->status == ttsr::RunStatus::ForceStopped);
        assert(rec->completed_chunks == 2);
        assert(rec->artifact_paths.size() == 2);
        assert(!fs::exists(fs::path(rep.output_dir) / "resume 3.mp3"));
    }

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(rep.resumed);
    assert(rep.completed == 5);
    assert(synth.calls.load() == 3);
    for (const auto& name : synth.seen()) {
        assert(name != "resume 1.mp3" && name != "resume 2.mp3");
    }
    for (int i = 1; i <= 5; ++i) {
        assert(fs::exists(fs::path(rep.output_dir) / ("resume " + std::to_string(i) + ".mp3")));
    }
}

static void test_missing_artifact_is_redone(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "gone.txt", 400);

    std::string out_dir;
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "gone 3.mp3") ctl.request_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::Stopped);
        assert(rep.completed == 3);
        out_dir = rep.output_dir;
    }

    fs::remove(fs::path(out_dir) / "gone 2.mp3");

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(synth.calls.load() == 2);
    auto seen = synth.seen();
    assert(std::find(seen.begin(), seen.end(), "gone 2.mp3") != seen.end());
    assert(std::find(seen.begin(), seen.end(), "gone 4.mp3") != seen.end());
}

static void test_changed_document_starts_over(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "draft.txt", 500);

    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "draft 3.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        assert(conv.convert(doc, {}).completed == 2);
    }

    write_file(doc, words_text(700));

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(!rep.resumed);
    assert(rep.total == 7);
    assert(synth.calls.load() == 7);
}

static void test_same_length_edit_starts_over(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "edit.txt", 300);

    std::string out_dir;
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "edit 3.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::ForceStopped);
        assert(rep.completed == 2);
        out_dir = rep.output_dir;
    }

    std::string text = words_text(300);
    std::replace(text.begin(), text.end(), 'a', 'z');
    write_file(doc, text);

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(!rep.resumed);
    assert(rep.total == 3);
    assert(synth.calls.load() == 3);
    for (int i = 1; i <= 3; ++i) {
        const std::string audio = read_file(fs::path(out_dir) / ("edit " + std::to_string(i) + ".mp3"));
        assert(audio.rfind("AUDIO:zbcd", 0) == 0);
    }
}

static void test_interrupt_before_dispatch(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "early.txt", 300);

    ttsr::install_interrupt_handlers();
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        std::raise(SIGINT);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::ForceStopped);
        assert(rep.completed == 0);
        assert(synth.calls.load() == 0);
        assert(ctl.state() == ttsr::RunState::Stopped);
        assert(!ctl.poll_signals());

        auto rec = conv.find_incomplete(doc, "");
        assert(rec.has_value());
        assert(rec->status == ttsr::RunStatus::ForceStopped);
    }
    ttsr::restore_interrupt_handlers();

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(rep.resumed);
    assert(synth.calls.load() == 3);
}

static void test_disk_error_ends_run(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    cfg.max_retries = 3;
    const fs::path doc = make_doc(root, "disk.txt", 300);

    FakeSynthesizer synth;
    synth.hook = [](const fs::path& dest, const ttsr::CancelToken&) {
        if (dest.filename() == "disk 2.mp3") throw ttsr::TtsrException(ttsr::ErrorCode::IoError, "disk full");
    };
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);

    bool threw = false;
    try {
        conv.convert(doc, {});
    } catch (const ttsr::TtsrException& e) {
        threw = (e.code() == ttsr::ErrorCode::IoError);
    }
    assert(threw);
    assert(synth.calls.load() == 2);
    assert(!ctl.processing_started());

    auto rec = conv.find_incomplete(doc, "");
    assert(rec.has_value());
    assert(rec->completed_chunks == 1);
    assert(rec->failed_chunks.empty());
}

static void test_fresh_start_ignores_progress(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "again.txt", 300);

    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "again 2.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        assert(conv.convert(doc, {}).completed == 1);
    }

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    ttsr::ConvertOptions opt;
    opt.resume = false;
    auto rep = conv.convert(doc, opt);
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(!rep.resumed);
    assert(synth.calls.load() == 3);
}

static void test_processing_time_accumulates(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    cfg.keep_completed_records = true;
    const fs::path doc = make_doc(root, "timed.txt", 400);
    const std::string key = key_for(doc);

    double first = 0.0;
    {
        FakeSynthesizer synth;
        synth.delay_ms = 30;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "timed 3.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::ForceStopped);
        first = conv.store().get_cumulative_time(key);
        assert(first > 0.0);
        assert(std::fabs(first - rep.session_seconds) < 1e-3);
    }

    FakeSynthesizer synth;
    synth.delay_ms = 30;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(rep.total_seconds >= first + rep.session_seconds - 1e-3);
    const double total = conv.store().get_cumulative_time(key);
    assert(std::fabs(total - (first + rep.session_seconds)) < 1e-3);
}

static void test_stop_and_delete(const fs::path& root) {
    ttsr::Config cfg = small_config(root);

    // audio deleted on confirmation
    {
        const fs::path doc = make_doc(root, "wipe.txt", 400);
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "wipe 2.mp3") ctl.request_stop_and_delete();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        std::string asked;
        auto rep = conv.convert(doc, {}, [&](const std::string& q) {
            asked = q;
            return true;
        });
        assert(rep.outcome == ttsr::ConvertOutcome::Deleted);
        assert(asked.find("2 audio file(s)") != std::string::npos);
        assert(!fs::exists(rep.output_dir));
        assert(!conv.store().load(key_for(doc)).has_value());
        assert(!fs::exists(conv.chunker().cache_path(ttsr::normalize_document_path(doc))));
    }

    // audio kept when declined
    {
        const fs::path doc = make_doc(root, "keep.txt", 400);
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "keep 2.mp3") ctl.request_stop_and_delete();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {}, [](const std::string&) { return false; });
        assert(rep.outcome == ttsr::ConvertOutcome::Deleted);
        assert(fs::exists(fs::path(rep.output_dir) / "keep 1.mp3"));
        assert(fs::exists(fs::path(rep.output_dir) / "keep 2.mp3"));
        assert(!conv.store().load(key_for(doc)).has_value());
    }
}

static void test_failed_chunk_is_retried_next_run(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "flaky.txt", 500);

    {
        FakeSynthesizer synth;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "flaky 2.mp3") {
                throw ttsr::TtsrException(ttsr::ErrorCode::SynthesisFailed, "HTTP 503");
            }
        };
        ttsr::ShutdownController ctl;
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        auto rep = conv.convert(doc, {});
        assert(rep.outcome == ttsr::ConvertOutcome::Failed);
        assert(rep.completed == 4);
        assert(rep.failed == std::vector<int>{1});

        auto rec = conv.find_incomplete(doc, "");
        assert(rec.has_value());
        assert(rec->failed_chunks == std::vector<int>{1});
        assert(rec->completed_chunks == 4);
        assert(rec->status == ttsr::RunStatus::Processing);
    }

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    auto rep = conv.convert(doc, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(synth.calls.load() == 1);
    assert(synth.seen() == std::vector<std::string>{"flaky 2.mp3"});
}

static void test_settings_and_labels(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "shared.txt", 300);

    // prefix from the explicit output directory name
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        ttsr::ConvertOptions opt;
        opt.output_dir = (root / "Narration").string() + "/";
        opt.session_label = "narration";
        auto rep = conv.convert(doc, opt);
        assert(rep.outcome == ttsr::ConvertOutcome::Completed);
        assert(rep.prefix == "Narration");
        assert(fs::exists(root / "Narration" / "Narration 1.mp3"));
        assert(rep.run_key == key_for(doc, "narration"));
        assert(rep.run_key != key_for(doc));
    }

    // restored settings win over defaults, explicit wins over restored
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == "voice 2.mp3") ctl.request_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        ttsr::ConvertOptions opt;
        opt.prefix = "voice";
        opt.language = "de";
        opt.slow = true;
        auto rep = conv.convert(doc, opt);
        assert(rep.outcome == ttsr::ConvertOutcome::Stopped);
    }
    {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        ttsr::ConvertOptions opt;
        opt.language = "fr";
        auto rep = conv.convert(doc, opt);
        assert(rep.outcome == ttsr::ConvertOutcome::Completed);
        assert(rep.prefix == "voice");
        assert(synth.calls.load() == 1);
        assert(synth.seen() == std::vector<std::string>{"voice 3.mp3"});
    }
}

static void test_maintenance(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path a = make_doc(root, "m_a.txt", 300);
    const fs::path b = make_doc(root, "m_b.txt", 300);

    auto stop_at_second = [&](const fs::path& doc, const std::string& stem) {
        FakeSynthesizer synth;
        ttsr::ShutdownController ctl;
        synth.hook = [&](const fs::path& dest, const ttsr::CancelToken&) {
            if (dest.filename() == stem + " 2.mp3") ctl.request_force_stop();
        };
        ttsr::Converter conv(cfg, &synth, ctl, nullptr);
        return conv.convert(doc, {});
    };

    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, nullptr, ctl, nullptr);

    // purge with audio
    auto rep = stop_at_second(a, "m_a");
    assert(rep.completed == 1);
    const fs::path a1 = fs::path(rep.output_dir) / "m_a 1.mp3";
    assert(fs::exists(a1));
    assert(conv.purge_progress(a, "", true));
    assert(!fs::exists(a1));
    assert(!conv.find_incomplete(a, "").has_value());
    assert(!conv.purge_progress(a, "", true));

    // clean keeps audio
    rep = stop_at_second(b, "m_b");
    const fs::path b1 = fs::path(rep.output_dir) / "m_b 1.mp3";
    assert(conv.clean_progress(b, ""));
    assert(fs::exists(b1));
    assert(!conv.find_incomplete(b, "").has_value());

    // cleanup everything
    stop_at_second(a, "m_a");
    stop_at_second(b, "m_b");
    assert(conv.store().count() == 2);
    assert(conv.cleanup_all() == 2);
    assert(conv.store().count() == 0);
    assert(!fs::exists(cfg.database_path()));
    assert(fs::exists(b1));

    // conversion needs a provider
    bool threw = false;
    try {
        conv.convert(a, {});
    } catch (const ttsr::TtsrException& e) {
        threw = (e.code() == ttsr::ErrorCode::InvalidArgs);
    }
    assert(threw);
}

static void test_error_paths(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);

    bool threw = false;
    try {
        conv.convert(root / "does_not_exist.txt", {});
    } catch (const ttsr::TtsrException& e) {
        threw = (e.code() == ttsr::ErrorCode::IoError);
    }
    assert(threw);

    const fs::path doc = make_doc(root, "blocked.txt", 200);
    write_file(root / "plainfile", "x");
    ttsr::ConvertOptions opt;
    opt.output_dir = (root / "plainfile" / "sub").string();
    threw = false;
    try {
        conv.convert(doc, opt);
    } catch (const ttsr::TtsrException& e) {
        threw = (e.code() == ttsr::ErrorCode::IoError || e.code() == ttsr::ErrorCode::PermissionDenied);
    }
    assert(threw);
    assert(synth.calls.load() == 0);

    // whitespace-only document
    const fs::path blank = root / "blank.txt";
    write_file(blank, "   \n\n  ");
    auto rep = conv.convert(blank, {});
    assert(rep.outcome == ttsr::ConvertOutcome::Empty);
    assert(rep.total == 0);
}

static void test_stale_partial_files_removed(const fs::path& root) {
    ttsr::Config cfg = small_config(root);
    const fs::path doc = make_doc(root, "partial.txt", 200);
    const fs::path out = root / "partial_out";
    fs::create_directories(out);
    write_file(out / "partial 2.mp3.part", "half");
    write_file(out / "other 1.mp3.part", "not ours");

    FakeSynthesizer synth;
    ttsr::ShutdownController ctl;
    ttsr::Converter conv(cfg, &synth, ctl, nullptr);
    ttsr::ConvertOptions opt;
    opt.output_dir = out.string();
    opt.prefix = "partial";
    auto rep = conv.convert(doc, opt);
    assert(rep.outcome == ttsr::ConvertOutcome::Completed);
    assert(!fs::exists(out / "partial 2.mp3.part"));
    assert(fs::exists(out / "other 1.mp3.part"));
}

static void test_validate_record(const fs::path& root) {
    const fs::path art = root / "v 1.mp3";
    write_file(art, "AUDIO");

    ttsr::CheckpointRecord r;
    r.run_key = "k";
    r.document_path = "/doc.txt";
    r.total_chunks = 3;
    r.completed_chunks = 1;
    r.artifact_paths = {art.string()};
    r.failed_chunks = {2};
    auto vr = ttsr::validate_record(r);
    assert(vr.ok);
    assert(vr.errors.empty());

    r.completed_chunks = 2;
    r.artifact_paths.push_back((root / "v 2.mp3").string());
    r.failed_chunks = {2, 2, 7};
    vr = ttsr::validate_record(r);
    assert(!vr.ok);
    // missing artifact, duplicate index, index out of range
    assert(vr.errors.size() == 3);

    r.completed_chunks = 5;
    vr = ttsr::validate_record(r);
    assert(!vr.ok);

    assert(std::string(ttsr::to_string(ttsr::ConvertOutcome::ForceStopped)) == "force_stopped");
}

int main() {
    auto root = mk_tmp_dir("converter");

    test_end_to_end(sub(root, "e2e"));
    test_completed_record_dropped_by_default(sub(root, "drop"));
    test_resume_skips_finished_chunks(sub(root, "resume"));
    test_missing_artifact_is_redone(sub(root, "gone"));
    test_changed_document_starts_over(sub(root, "changed"));
    test_same_length_edit_starts_over(sub(root, "edit"));
    test_fresh_start_ignores_progress(sub(root, "fresh"));
    test_interrupt_before_dispatch(sub(root, "early"));
    test_disk_error_ends_run(sub(root, "disk"));
    test_processing_time_accumulates(sub(root, "timed"));
    test_stop_and_delete(sub(root, "delete"));
    test_failed_chunk_is_retried_next_run(sub(root, "flaky"));
    test_settings_and_labels(sub(root, "settings"));
    test_maintenance(sub(root, "maint"));
    test_error_paths(sub(root, "errors"));
    test_stale_partial_files_removed(sub(root, "partial"));
    test_validate_record(root);

    fs::remove_all(root);
    std::cout << "OK\n";
    return 0;
}
