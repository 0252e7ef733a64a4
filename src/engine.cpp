#include "keel/engine.hpp"

#include "keel/utility.hpp"

#include <algorithm>
#include <atomic>
#if FF_keel__profiling
#include <chrono>
#endif
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <ostream>
#include <queue>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace keel {

const RuleOutcome *BuildReport::find(const BuildTarget &target) const {
    auto it = std::lower_bound(outcomes_.begin(), outcomes_.end(), target,
                               [](const RuleOutcome &o, const BuildTarget &t) { return o.target < t; });
    if (it != outcomes_.end() && it->target == target)
        return &*it;
    return nullptr;
}

size_t BuildReport::count(RuleState state) const {
    return static_cast<size_t>(
        std::count_if(outcomes_.begin(), outcomes_.end(), [state](const RuleOutcome &o) { return o.state == state; }));
}

size_t BuildReport::steps_executed() const {
    size_t n = 0;
    for (const auto &o : outcomes_)
        n += o.steps_executed;
    return n;
}

bool BuildReport::success() const {
    return std::all_of(outcomes_.begin(), outcomes_.end(), [](const RuleOutcome &o) {
        return o.state == RuleState::Built || o.state == RuleState::Reused;
    });
}

BuildEngine::BuildEngine(const DependencyGraph &graph, ArtifactCache &cache, EngineConfig config)
    : graph(graph), cache(cache), config(std::move(config)) {
}

Result<BuildReport> BuildEngine::build(const std::vector<BuildTarget> &targets) {
    auto closure = graph.transitive_closure(targets);
    if (!closure)
        return std::unexpected(closure.error());

    std::vector<size_t> selected;
    selected.reserve(closure->size());
    for (const BuildRule *rule : *closure) {
        selected.push_back(*graph.index_of(rule->target()));
    }
    return run(selected);
}

BuildReport BuildEngine::build_all() {
    std::vector<size_t> selected(graph.size());
    for (size_t i = 0; i < selected.size(); ++i)
        selected[i] = i;
    return run(selected);
}

namespace {

// A record only stands in for a rule if it describes that rule's own outputs.
bool describes_outputs(const ArtifactRecord &record, const std::vector<std::filesystem::path> &outputs) {
    if (record.outputs.size() != outputs.size())
        return false;
    for (size_t i = 0; i < outputs.size(); ++i) {
        if (record.outputs[i].path != outputs[i])
            return false;
    }
    return true;
}

} // namespace

bool BuildEngine::is_reusable(const BuildRule &rule, const RuleKey &key, RuleOutcome &outcome) {
    if (config.dry_run) {
        return cache.contains(key);
    }

    auto record = cache.get(key);
    if (!record) {
        std::lock_guard lock(out_mtx);
        *config.err << "warning: ignoring cache entry for " << outcome.target.full_name() << ": "
                    << record.error().message << '\n';
        return false;
    }
    if (!*record)
        return false;
    if (!describes_outputs(**record, rule.outputs())) {
        std::lock_guard lock(out_mtx);
        *config.err << "warning: cache entry " << key.to_string() << " belongs to " << (*record)->target
                    << ", not " << rule.full_name() << '\n';
        return false;
    }

    auto intact = cache.materialize(**record);
    if (!intact) {
        std::lock_guard lock(out_mtx);
        *config.err << "warning: " << intact.error().message << '\n';
        return false;
    }
    if (!*intact)
        return false;

    outcome.output_key = (*record)->output_key;
    return true;
}

RuleState BuildEngine::process_rule(size_t node_idx, RuleOutcome &outcome, size_t position, size_t total) {
    const BuildRule &rule = *graph.nodes()[node_idx].rule;

    auto report_failure = [&](Error err) {
        {
            std::lock_guard lock(out_mtx);
            *config.err << "Build failed: " << rule.type() << " " << rule.full_name() << ": " << err.message << '\n';
        }
        outcome.error = std::move(err);
        return RuleState::Failed;
    };

    try {
        const auto &key = rule.rule_key(hashes);
        if (!key) {
            return report_failure(key.error());
        }
        outcome.rule_key = *key;

        if (is_reusable(rule, *key, outcome)) {
#if FF_keel__logging
            std::lock_guard lock(out_mtx);
            *config.out << "Reusing " << rule.full_name() << " (" << key->to_string() << ")\n";
#endif
            return RuleState::Reused;
        }

        auto steps = rule.build_steps(BuildContext{config.out_dir});
        if (!steps) {
            return report_failure(steps.error());
        }

        {
            std::lock_guard lock(out_mtx);
            if (config.dry_run)
                *config.out << "[DRY RUN] ";
            else
                *config.out << "[" << position << "/" << total << "] ";
            *config.out << std::setw(8) << rule.type() << " " << rule.full_name() << '\n';
        }
        if (config.dry_run)
            return RuleState::Built;

        StepContext context{*config.out, *config.err, config.verbose};
        for (const auto &step : *steps) {
#if FF_keel__profiling
            auto start = std::chrono::steady_clock::now();
#endif
            auto res = step->execute(context);
#if FF_keel__profiling
            std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start;
            {
                std::lock_guard lock(out_mtx);
                *config.out << "Step " << step->description() << " took " << diff.count() << "s\n";
            }
#endif
            if (!res) {
                return report_failure(Error{res.error().kind, res.error().message});
            }
            ++outcome.steps_executed;
        }

        const auto outputs = rule.outputs();
        for (const auto &out : outputs) {
            std::error_code ec;
            if (!std::filesystem::exists(out, ec)) {
                return report_failure(Error{ErrorKind::StepExecution, "did not produce " + out.string()});
            }
        }

        // Only a fully built rule gets a record.
        auto record = cache.put(*key, rule.full_name(), std::string(rule.type()), outputs);
        if (!record) {
            std::lock_guard lock(out_mtx);
            *config.err << "warning: could not cache " << rule.full_name() << ": " << record.error().message << '\n';
        } else if (!describes_outputs(*record, outputs)) {
            std::lock_guard lock(out_mtx);
            *config.err << "warning: cache entry " << key->to_string() << " already holds " << record->target
                        << "; " << rule.full_name() << " was not recorded\n";
        } else {
            outcome.output_key = record->output_key;
        }
        return RuleState::Built;
    } catch (const std::exception &err) {
        return report_failure(Error{ErrorKind::StepExecution, err.what()});
    }
}

BuildReport BuildEngine::run(const std::vector<size_t> &selected) {
    const auto &nodes = graph.nodes();
    const size_t total_nodes = selected.size();

    BuildReport report;
    if (total_nodes == 0)
        return report;

    std::vector<char> in_run(nodes.size(), 0);
    std::vector<RuleOutcome> outcomes(nodes.size());
    std::vector<std::atomic<RuleState>> states(nodes.size());
    std::vector<size_t> pending_deps(nodes.size(), 0);

    for (size_t idx : selected) {
        in_run[idx] = 1;
        outcomes[idx].target = nodes[idx].rule->target();
        states[idx].store(RuleState::Pending);
        pending_deps[idx] = nodes[idx].dep_edges.size();
    }

    // Ready rules are handed out smallest target first so dispatch is reproducible.
    auto later = [&](size_t a, size_t b) { return nodes[b].rule->target() < nodes[a].rule->target(); };
    std::priority_queue<size_t, std::vector<size_t>, decltype(later)> ready_queue(later);
    for (size_t idx : selected) {
        if (pending_deps[idx] == 0)
            ready_queue.push(idx);
    }

    std::mutex mtx;
    std::condition_variable cv_ready;
    size_t completed_count = 0;
    size_t active_workers = 0;
    size_t dispatched = 0;
    bool stopping = false;

    // Caller holds mtx.
    auto block_dependents = [&](size_t failed_idx) {
        const BuildTarget &cause = nodes[failed_idx].rule->target();
        const Error &cause_error = *outcomes[failed_idx].error;
        std::vector<size_t> stack{failed_idx};
        while (!stack.empty()) {
            size_t u = stack.back();
            stack.pop_back();
            for (size_t v : nodes[u].out_edges) {
                if (!in_run[v])
                    continue;
                RuleState expected = RuleState::Pending;
                if (!states[v].compare_exchange_strong(expected, RuleState::Blocked))
                    continue;
                outcomes[v].blocked_by = cause;
                outcomes[v].error = Error{cause_error.kind, "not attempted because dependency " + cause.full_name() +
                                                                " failed: " + cause_error.message};
                ++completed_count;
                stack.push_back(v);
            }
        }
    };

    auto worker = [&]() {
        while (true) {
            size_t node_idx;
            size_t position;
            {
                std::unique_lock lock(mtx);
                cv_ready.wait(lock, [&] {
                    return !ready_queue.empty() || completed_count == total_nodes || stopping || active_workers == 0;
                });

                // Done, stopping, or nothing left that can become ready.
                if (ready_queue.empty() || stopping)
                    return;

                node_idx = ready_queue.top();
                ready_queue.pop();

                // The claim is the single-computation guard: one attempt per rule per run.
                RuleState expected = RuleState::Pending;
                if (!states[node_idx].compare_exchange_strong(expected, RuleState::Building))
                    continue;

                active_workers++;
                position = ++dispatched;
                report.dispatch_order_.push_back(nodes[node_idx].rule->target());
            }

            RuleState result = process_rule(node_idx, outcomes[node_idx], position, total_nodes);

            {
                std::lock_guard lock(mtx);
                active_workers--;
                states[node_idx].store(result);
                ++completed_count;

                size_t new_work_count = 0;
                if (result == RuleState::Failed) {
                    block_dependents(node_idx);
                    if (!config.keep_going)
                        stopping = true;
                } else {
                    for (size_t neighbor : nodes[node_idx].out_edges) {
                        if (!in_run[neighbor])
                            continue;
                        if (--pending_deps[neighbor] == 0 && states[neighbor].load() == RuleState::Pending) {
                            ready_queue.push(neighbor);
                            new_work_count++;
                        }
                    }
                }

                bool build_finished = (completed_count == total_nodes);
                bool stall_detected = (active_workers == 0);
                constexpr auto TUNABLE__notify_all_criteria = 10;
                if (build_finished || stopping || stall_detected) {
                    cv_ready.notify_all();
                } else if (new_work_count == 1) {
                    cv_ready.notify_one();
                } else if (new_work_count >= TUNABLE__notify_all_criteria) {
                    cv_ready.notify_all();
                } else {
                    for (size_t ii = 0; ii < new_work_count; ++ii) {
                        cv_ready.notify_one();
                    }
                }
            }
        }
    };

    size_t thread_count = config.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    thread_count = std::min(thread_count, total_nodes);

    {
        std::vector<std::jthread> pool;
        pool.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            pool.emplace_back(worker);
        }
    } // Join all threads

    report.outcomes_.reserve(total_nodes);
    for (size_t idx : selected) {
        RuleOutcome &outcome = outcomes[idx];
        outcome.state = states[idx].load();
        if (outcome.state == RuleState::Pending) {
            outcome.state = RuleState::Cancelled;
        }
        report.outcomes_.push_back(std::move(outcome));
    }
    std::sort(report.outcomes_.begin(), report.outcomes_.end(),
              [](const RuleOutcome &a, const RuleOutcome &b) { return a.target < b.target; });
    return report;
}

Result<void> BuildEngine::clean() {
    std::optional<Error> first_error;

    for (const auto &node : graph.nodes()) {
        const BuildRule &rule = *node.rule;
        for (const auto &out : rule.outputs()) {
            // Outputs that are also inputs (prebuilt binaries) are sources, not artifacts.
            const auto &inputs = rule.inputs();
            if (std::find(inputs.begin(), inputs.end(), out) != inputs.end())
                continue;

            std::error_code ec;
            if (!std::filesystem::exists(out, ec))
                continue;
            std::filesystem::remove(out, ec);
            if (ec) {
                *config.err << "Failed to remove " << out.string() << ": " << ec.message() << '\n';
                if (!first_error)
                    first_error = Error{ErrorKind::IO, "Failed to remove " + out.string() + ": " + ec.message()};
            } else {
                *config.out << "Removed " << out.string() << '\n';
            }
        }
    }

    if (first_error)
        return std::unexpected(*first_error);
    return {};
}

Result<void> BuildEngine::emit_graph(std::ostream &out) {
    graph.write_dot(out, [&](const BuildRule &rule) -> std::string {
        const auto &key = rule.rule_key(hashes);
        if (!key)
            return "red";
        return cache.contains(*key) ? "white" : "green";
    });
    if (!out)
        return fail(ErrorKind::IO, "Failed to write the graph");
    return {};
}

} // namespace keel
