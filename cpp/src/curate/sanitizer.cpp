// ==============================================================================
// sanitizer.cpp - Фаза 3: санитизация и анонимизация отчётов
// ==============================================================================

#include <algorithm>
#include <atomic>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <curator/sanitizer.hpp>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace curator::curate {

// ============================================================================
// Термины
// ============================================================================

std::optional<std::vector<std::string>> load_terms(const std::filesystem::path& path) {
    auto content = platform::read_file(path);
    if (!content.has_value()) {
        return std::nullopt;
    }

    std::vector<std::string> terms;
    std::size_t start = 0;
    const std::string& text = *content;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Пустой термин совпал бы с каждой позицией
        if (!line.empty()) {
            terms.push_back(std::move(line));
        }
        start = end + 1;
    }
    return terms;
}

std::size_t anonymize_text(std::string& text, const std::vector<std::string>& terms,
                           const std::string& redaction) {
    std::size_t replaced = 0;
    for (const auto& term : terms) {
        if (term.empty()) {
            continue;
        }
        std::size_t pos = text.find(term);
        while (pos != std::string::npos) {
            text.replace(pos, term.size(), redaction);
            ++replaced;
            pos = text.find(term, pos + redaction.size());
        }
    }
    return replaced;
}

// ============================================================================
// Структурная санитизация
// ============================================================================

void redact_process_tree(Value& node, const std::string& redaction) {
    if (node.is_object()) {
        if (Value* children = node.get_mut("children")) {
            redact_process_tree(*children, redaction);
        }
        if (node.has("environ")) {
            node.set("environ", Value(redaction));
        }
    } else if (auto* items = node.get_array_mut()) {
        for (auto& item : *items) {
            redact_process_tree(item, redaction);
        }
    }
}

void sanitize_document(Value& report, const SanitizeConfig& config) {
    for (const auto& section : config.sections_to_delete) {
        report.erase(section);
    }

    if (Value* processes = lookup_mut(report, {"behavior", "processes"})) {
        if (auto* list = processes->get_array_mut()) {
            for (auto& process : *list) {
                if (process.has("environ")) {
                    process.set("environ", Value(config.redaction));
                }
            }
        }
    }

    if (Value* tree = lookup_mut(report, {"behavior", "processtree"})) {
        redact_process_tree(*tree, config.redaction);
    }

    if (!report.has("detections")) {
        report.set("detections", Value(io::NA_SENTINEL));
    }
}

void sanitize_report(const std::filesystem::path& path, const SanitizeConfig& config) {
    auto loaded = io::load_report(path);
    if (!loaded.ok) {
        throw std::runtime_error(loaded.error.format());
    }

    sanitize_document(loaded.report.data, config);

    // Замена терминов идёт по уже переписанному тексту, запись одна
    std::string text = io::serialize_report(loaded.report.data, true);
    anonymize_text(text, config.terms, config.redaction);
    platform::write_file_atomic(path, text);
}

// ============================================================================
// Пул рабочих потоков
// ============================================================================

const ThreadFactory& default_thread_factory() {
    static const ThreadFactory factory = [](std::function<void()> fn) {
        return std::thread(std::move(fn));
    };
    return factory;
}

SanitizeResult run_sanitizer(const std::vector<std::filesystem::path>& reports,
                             const SanitizeConfig& config, std::size_t workers,
                             output::Writer& writer, const ThreadFactory& make_thread) {
    writer.rule("Phase 3: Sanitize and anonymize reports", output::Color::Cyan);
    writer.info("Total reports: " + std::to_string(reports.size()));

    SanitizeResult result;
    if (reports.empty()) {
        writer.rule("End of Phase 3", output::Color::Cyan);
        return result;
    }

    const std::size_t num_workers = std::max<std::size_t>(1, std::min(workers, reports.size()));
    writer.debug("Sanitizer workers: " + std::to_string(num_workers));

    // Каждый поток копит свои ошибки, слияние после join
    std::vector<std::vector<SanitizeFailure>> worker_failures(num_workers);
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> processed{0};

    writer.progress_begin("Sanitize & anonymize reports", reports.size());

    auto work = [&](std::size_t t) {
        for (;;) {
            std::size_t index = next.fetch_add(1);
            if (index >= reports.size()) {
                break;
            }
            const auto& path = reports[index];
            try {
                sanitize_report(path, config);
                processed.fetch_add(1);
            } catch (const std::exception& e) {
                writer.error("failed to sanitize report '" + platform::path_to_utf8(path) +
                             "' - " + e.what());
                worker_failures[t].push_back(SanitizeFailure{path, e.what()});
            }
            writer.progress_advance();
        }
    };

    const ThreadFactory& spawn = make_thread ? make_thread : default_thread_factory();

    std::vector<std::thread> pool;
    pool.reserve(num_workers);
    for (std::size_t t = 0; t < num_workers; ++t) {
        try {
            pool.push_back(spawn([&work, t]() { work(t); }));
        } catch (const std::system_error& e) {
            // Запущенные потоки разберут всю очередь
            writer.warn("could not start sanitizer worker " + std::to_string(t + 1) + " of " +
                        std::to_string(num_workers) + " - " + e.what());
            break;
        }
    }

    if (pool.empty()) {
        writer.warn("no sanitizer workers started, sanitizing on the calling thread");
        work(0);
    }

    for (auto& th : pool) {
        th.join();
    }
    writer.progress_end();

    result.processed = processed.load();
    for (auto& failures : worker_failures) {
        for (auto& f : failures) {
            result.failures.push_back(std::move(f));
        }
    }

    writer.rule("End of Phase 3", output::Color::Cyan);
    return result;
}

}  // namespace curator::curate
