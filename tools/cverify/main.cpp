/**
 * @file main.cpp
 * @brief cverify CLI entry point
 *
 * Commands:
 *   submit    - Submit a contract and run its verification job
 *   status    - Show the verification status of a contract
 *   show      - Print the stored contract record
 *   files     - List or print the retained sources of a contract
 *   sweep     - List orphaned pending jobs and optionally recover them
 *   registry  - List supported licenses and languages
 *   cid       - Canonicalize a module and print its CID
 *   exports   - List exported functions of a wasm module
 *   version   - Show version information
 */

#include "cverify/canonical_json.hpp"
#include "cverify/cid.hpp"
#include "cverify/common.hpp"
#include "cverify/compiler_driver.hpp"
#include "cverify/config.hpp"
#include "cverify/contract_store.hpp"
#include "cverify/executor.hpp"
#include "cverify/log.hpp"
#include "cverify/manifest.hpp"
#include "cverify/onchain.hpp"
#include "cverify/pipeline.hpp"
#include "cverify/publisher.hpp"
#include "cverify/registry.hpp"
#include "cverify/service.hpp"
#include "cverify/source_bundle.hpp"
#include "cverify/version.hpp"
#include "cverify/wasm.hpp"
#include "cverify/workspace.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitRejected = 2;

void print_version()
{
    std::println("cverify {} ({})", cverify::kVersion, cverify::kBuildId);
    std::println("  config:   {}", cverify::kConfigSchemaVersion);
    std::println("  registry: {}", cverify::kRegistrySchemaVersion);
    std::println("  record:   {}", cverify::kContractRecordSchemaVersion);
}

void print_help()
{
    std::print(R"(cverify - Reproducible smart contract source verification

Usage: cverify <command> [options]

Commands:
  submit      Submit a contract and run its verification job
  status      Show the verification status of a contract
  show        Print the stored contract record
  files       List or print the retained sources of a contract
  sweep       List orphaned pending jobs and optionally recover them
  registry    List supported licenses and languages
  cid         Canonicalize a module and print its CID
  exports     List exported functions of a wasm module
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'cverify <command> --help' for command-specific options.
)");
}

void print_submit_help()
{
    std::print(R"(Usage: cverify submit [options]

Submit a contract for verification and run the job to completion

Options:
  --config FILE             Verifier configuration (required)
  --address ADDR            Contract address (required)
  --license NAME            Source license (required)
  --lang NAME               Source language (required)
  --manifest FILE           Dependency manifest JSON (default: none)
  --source DIR              Source directory (required)
  --submitter ID            Submitter identity
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug logging
  --help, -h                Show this help

Exit status: 0 verified, 2 rejected or failed, 1 error
)");
}

void print_status_help()
{
    std::print(R"(Usage: cverify status|show [options]

Options:
  --config FILE             Verifier configuration (required)
  --address ADDR            Contract address (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_files_help()
{
    std::print(R"(Usage: cverify files [options]

List the source files retained with a contract

Options:
  --config FILE             Verifier configuration (required)
  --address ADDR            Contract address (required)
  --cat PATH                Print one file
  --all                     Print every file as a JSON array of name and content
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_sweep_help()
{
    std::print(R"(Usage: cverify sweep [options]

List pending jobs whose owning instance is gone

Options:
  --config FILE             Verifier configuration (required)
  --requeue                 Run every orphan again under this instance
  --fail-out REASON         Close every orphan as failed_build
  --republish               Deliver outcome notifications again instead
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_registry_help()
{
    std::print(R"(Usage: cverify registry [options]

Options:
  --config FILE             Verifier configuration
  --registry FILE           Registry file (overrides the configuration)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_cid_help()
{
    std::print(R"(Usage: cverify cid FILE [options]

Options:
  --format wasm|raw         Artifact format (default: wasm)
  --help, -h                Show this help
)");
}

void print_exports_help()
{
    std::print(R"(Usage: cverify exports FILE

List exported functions of a wasm module
)");
}

struct CommandOptions
{
    std::string config;
    std::string schema_dir;
    std::string address;
    std::string license;
    std::string language;
    std::string manifest;
    std::string source;
    std::string submitter;
    std::string registry;
    std::string format;
    std::string cat;
    std::optional<std::string> fail_out;
    std::vector<std::string> positional;
    bool requeue;
    bool republish;
    bool all;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> cverify::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            cverify::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] cverify::Result<CommandOptions> parse_args(std::span<char*> args)
{
    CommandOptions options{.config = std::string{},
                           .schema_dir = "schemas",
                           .address = std::string{},
                           .license = std::string{},
                           .language = std::string{},
                           .manifest = std::string{},
                           .source = std::string{},
                           .submitter = std::string{},
                           .registry = std::string{},
                           .format = "wasm",
                           .cat = std::string{},
                           .fail_out = std::nullopt,
                           .positional = {},
                           .requeue = false,
                           .republish = false,
                           .all = false,
                           .verbose = false,
                           .show_help = false};

    const std::vector<std::pair<std::string_view, std::string*>> valued = {
        {    "--config",     &options.config},
        {"--schema-dir", &options.schema_dir},
        {   "--address",    &options.address},
        {   "--license",    &options.license},
        {      "--lang",   &options.language},
        {  "--manifest",   &options.manifest},
        {    "--source",     &options.source},
        { "--submitter",  &options.submitter},
        {  "--registry",   &options.registry},
        {    "--format",     &options.format},
        {       "--cat",        &options.cat},
    };

    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--requeue") {
            options.requeue = true;
            continue;
        }
        if (arg == "--republish") {
            options.republish = true;
            continue;
        }
        if (arg == "--all") {
            options.all = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--fail-out") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.fail_out = *value;
            skip_next = true;
            continue;
        }
        bool matched = false;
        for (const auto& [name, target] : valued) {
            if (arg == name) {
                auto value = read_option_value(args, idx, arg);
                if (!value) {
                    return std::unexpected(value.error());
                }
                *target = *value;
                skip_next = true;
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                cverify::Error::make("UnknownOption", std::string("Unknown option: ") + std::string(arg)));
        }
        options.positional.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] cverify::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(cverify::Error::make("IOError", "Failed to open file: " + path.string()));
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

/// Everything a stateful command needs, assembled from the configuration
struct Runtime
{
    cverify::config::VerifierConfig config;
    std::shared_ptr<cverify::pipeline::VerificationPipeline> pipeline;
};

[[nodiscard]] cverify::Result<Runtime> open_runtime(const CommandOptions& options)
{
    if (options.config.empty()) {
        return std::unexpected(cverify::Error::make("MissingArgument", "--config is required"));
    }
    const std::filesystem::path schema_dir(options.schema_dir);
    auto config = cverify::config::load_config(options.config, schema_dir);
    if (!config) {
        return std::unexpected(config.error());
    }
    cverify::log::set_level(options.verbose ? cverify::log::Level::kDebug : config->log_level);

    auto snapshot = cverify::registry::load_registry(config->registry, schema_dir);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    std::shared_ptr<cverify::publish::ResultPublisher> publisher;
    if (config->notifications) {
        publisher = std::make_shared<cverify::publish::ResultPublisher>(
            std::make_shared<cverify::publish::JsonLinesSink>(*config->notifications),
            config->data_dir / "publish_ledger.jsonl",
            schema_dir);
    }

    cverify::pipeline::Collaborators collaborators{
        .registry = std::make_shared<const cverify::registry::RegistrySnapshot>(std::move(*snapshot)),
        .repository = std::make_shared<cverify::store::FileContractRepository>(config->data_dir, schema_dir),
        .workspaces = std::make_shared<const cverify::workspace::WorkspaceBuilder>(
            config->work_dir,
            std::make_shared<const cverify::workspace::LocalDependencyStore>(config->dependency_store),
            config->limits),
        .compiler = std::make_shared<const cverify::compiler::CompilerDriver>(
            std::make_shared<cverify::sandbox::ProcessExecutor>(), config->isolate_network),
        .onchain = std::make_shared<cverify::onchain::FileOnChainCidSource>(config->onchain_index),
        .publisher = std::move(publisher),
    };
    cverify::pipeline::PipelineOptions pipeline_options{
        .quotas = config->quotas,
        .retry = config->retry,
        .replace_policy = config->allow_resubmit_failed ? cverify::store::ReplacePolicy::kTerminalFailed
                                                        : cverify::store::ReplacePolicy::kNever,
        .owner = {},
        .clock = {},
        .job_ids = {},
        .sleeper = {},
    };

    Runtime runtime{.config = std::move(*config), .pipeline = nullptr};
    runtime.pipeline =
        std::make_shared<cverify::pipeline::VerificationPipeline>(std::move(collaborators), std::move(pipeline_options));
    return runtime;
}

void print_record(const cverify::store::ContractRecord& record)
{
    std::println("address:      {}", record.address);
    std::println("status:       {}", cverify::store::status_name(record.status));
    std::println("language:     {} (revision {})", record.language.name, record.language.revision);
    std::println("computed_cid: {}", record.computed_cid.empty() ? "-" : record.computed_cid);
    std::println("onchain_cid:  {}", record.onchain_cid.empty() ? "-" : record.onchain_cid);
    if (!record.exports.empty()) {
        std::println("exports:      {}", record.exports.size());
        for (const auto& name : record.exports) {
            std::println("  {}", name);
        }
    }
    if (!record.diagnostics.empty()) {
        std::println("diagnostics:\n{}", record.diagnostics);
    }
}

[[nodiscard]] int exit_code_for(const cverify::store::ContractRecord& record)
{
    return record.status == cverify::store::Status::kVerified ? kExitOk : kExitRejected;
}

[[nodiscard]] bool is_rejection(const cverify::Error& error)
{
    return error.code == "LicenseUnsupported" || error.code == "LanguageUnsupported"
           || error.code == "AlreadyRegistered";
}

/// Run accepted jobs on the worker pool and wait for all of them
[[nodiscard]] std::vector<cverify::store::ContractRecord> run_jobs(Runtime& runtime,
                                                                   const std::vector<cverify::pipeline::Accepted>& jobs,
                                                                   int& exit_code)
{
    std::mutex results_mutex;
    std::vector<cverify::store::ContractRecord> finished;
    cverify::service::VerificationService service(runtime.pipeline, runtime.config.workers);
    bool started = service.start([&](const cverify::pipeline::Accepted& job,
                                     const cverify::Result<cverify::store::ContractRecord>& result) {
        std::lock_guard lock(results_mutex);
        if (result) {
            finished.push_back(*result);
        } else {
            std::println(stderr, "Error: job {} for {}: {}", job.job_id, job.address, result.error().message);
            exit_code = kExitError;
        }
    });
    if (!started) {
        std::println(stderr, "Error: failed to start workers");
        exit_code = kExitError;
        return finished;
    }
    for (const auto& job : jobs) {
        if (!service.enqueue(job)) {
            std::println(stderr, "Error: failed to queue job {} for {}", job.job_id, job.address);
            exit_code = kExitError;
        }
    }
    service.wait_idle();
    service.stop();
    return finished;
}

int cmd_submit(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_submit_help();
        return kExitOk;
    }
    if (options->address.empty() || options->license.empty() || options->language.empty()
        || options->source.empty()) {
        std::println(stderr, "Error: --address, --license, --lang and --source are required");
        print_submit_help();
        return kExitError;
    }

    auto runtime = open_runtime(*options);
    if (!runtime) {
        std::println(stderr, "Error: {}", runtime.error().message);
        return kExitError;
    }

    cverify::manifest::DependencyManifest dependencies;
    if (!options->manifest.empty()) {
        auto text = read_text_file(options->manifest);
        if (!text) {
            std::println(stderr, "Error: {}", text.error().message);
            return kExitError;
        }
        auto parsed = cverify::manifest::parse_manifest_text(*text);
        if (!parsed) {
            std::println(stderr, "Error: {}", parsed.error().message);
            return kExitRejected;
        }
        dependencies = std::move(*parsed);
    }
    auto sources = cverify::load_bundle_from_directory(options->source, runtime->config.limits);
    if (!sources) {
        std::println(stderr, "Error: {}", sources.error().message);
        return kExitError;
    }

    auto accepted = runtime->pipeline->submit(cverify::pipeline::SubmitRequest{
        .address = options->address,
        .license = options->license,
        .language = options->language,
        .dependencies = std::move(dependencies),
        .sources = std::move(*sources),
        .submitter = options->submitter,
    });
    if (!accepted) {
        std::println(stderr, "{}", accepted.error().message);
        return is_rejection(accepted.error()) ? kExitRejected : kExitError;
    }
    std::println("accepted {} (job {})", accepted->address, accepted->job_id);

    int exit_code = kExitOk;
    auto finished = run_jobs(*runtime, {*accepted}, exit_code);
    for (const auto& record : finished) {
        print_record(record);
        if (exit_code == kExitOk) {
            exit_code = exit_code_for(record);
        }
    }
    return exit_code;
}

int cmd_status(std::span<char*> args, bool full_record)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_status_help();
        return kExitOk;
    }
    if (options->address.empty()) {
        std::println(stderr, "Error: --address is required");
        print_status_help();
        return kExitError;
    }
    auto runtime = open_runtime(*options);
    if (!runtime) {
        std::println(stderr, "Error: {}", runtime.error().message);
        return kExitError;
    }

    if (!full_record) {
        auto status = runtime->pipeline->query_status(options->address);
        if (!status) {
            std::println(stderr, "Error: {}", status.error().message);
            return kExitError;
        }
        std::println("{}", cverify::pipeline::state_name(*status));
        return kExitOk;
    }

    auto record = runtime->pipeline->find(options->address);
    if (!record) {
        std::println(stderr, "Error: {}", record.error().message);
        return kExitError;
    }
    if (!*record) {
        std::println(stderr, "Error: contract not found: {}", options->address);
        return kExitError;
    }
    auto canonical = cverify::canonical::canonicalize(cverify::store::to_json(**record));
    if (!canonical) {
        std::println(stderr, "Error: {}", canonical.error().message);
        return kExitError;
    }
    std::println("{}", *canonical);
    return kExitOk;
}

int cmd_sweep(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_sweep_help();
        return kExitOk;
    }
    if (static_cast<int>(options->requeue) + static_cast<int>(options->fail_out.has_value()) +
            static_cast<int>(options->republish) >
        1) {
        std::println(stderr, "Error: --requeue, --fail-out and --republish are mutually exclusive");
        return kExitError;
    }
    auto runtime = open_runtime(*options);
    if (!runtime) {
        std::println(stderr, "Error: {}", runtime.error().message);
        return kExitError;
    }

    if (options->republish) {
        auto summary = runtime->pipeline->republish_all();
        if (!summary) {
            std::println(stderr, "Error: {}", summary.error().message);
            return kExitError;
        }
        for (const auto& address : summary->delivered) {
            std::println("republished {}", address);
        }
        for (const auto& address : summary->undelivered) {
            std::println(stderr, "undelivered {}", address);
        }
        std::println("{} delivered, {} undelivered", summary->delivered.size(), summary->undelivered.size());
        return summary->undelivered.empty() ? kExitOk : kExitError;
    }

    const cverify::pipeline::ProcessLivenessProbe probe(runtime->pipeline->owner());
    auto orphans = runtime->pipeline->find_orphans(probe);
    if (!orphans) {
        std::println(stderr, "Error: {}", orphans.error().message);
        return kExitError;
    }
    std::println("{} orphaned pending job(s)", orphans->size());
    for (const auto& record : *orphans) {
        std::println("  {}  job {}  owner {}  since {}",
                     record.address,
                     record.job.job_id,
                     record.job.owner,
                     record.job.started_at);
    }

    int exit_code = kExitOk;
    if (options->fail_out) {
        for (const auto& record : *orphans) {
            auto failed = runtime->pipeline->fail_out(record.address, *options->fail_out, probe);
            if (!failed) {
                std::println(stderr, "Error: {}: {}", record.address, failed.error().message);
                exit_code = kExitError;
                continue;
            }
            std::println("failed out {}", record.address);
        }
    } else if (options->requeue) {
        std::vector<cverify::pipeline::Accepted> jobs;
        for (const auto& record : *orphans) {
            auto requeued = runtime->pipeline->requeue(record.address, probe);
            if (!requeued) {
                std::println(stderr, "Error: {}: {}", record.address, requeued.error().message);
                exit_code = kExitError;
                continue;
            }
            jobs.push_back(*requeued);
        }
        for (const auto& record : run_jobs(*runtime, jobs, exit_code)) {
            std::println("{} -> {}", record.address, cverify::store::status_name(record.status));
        }
    }
    return exit_code;
}

int cmd_files(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_files_help();
        return kExitOk;
    }
    if (options->address.empty()) {
        std::println(stderr, "Error: --address is required");
        print_files_help();
        return kExitError;
    }
    if (options->all && !options->cat.empty()) {
        std::println(stderr, "Error: --cat and --all are mutually exclusive");
        return kExitError;
    }
    auto runtime = open_runtime(*options);
    if (!runtime) {
        std::println(stderr, "Error: {}", runtime.error().message);
        return kExitError;
    }

    if (!options->cat.empty()) {
        auto content = runtime->pipeline->read_source(options->address, options->cat);
        if (!content) {
            std::println(stderr, "Error: {}", content.error().message);
            return kExitError;
        }
        std::print("{}", *content);
        return kExitOk;
    }

    auto bundle = runtime->pipeline->sources(options->address);
    if (!bundle) {
        std::println(stderr, "Error: {}", bundle.error().message);
        return kExitError;
    }
    if (!options->all) {
        for (const auto& path : bundle->files() | std::views::keys) {
            std::println("{}", path);
        }
        return kExitOk;
    }
    nlohmann::json listing = nlohmann::json::array();
    for (const auto& [path, content] : bundle->files()) {
        listing.push_back({
            {   "name",    path},
            {"content", content},
        });
    }
    auto canonical = cverify::canonical::canonicalize(listing);
    if (!canonical) {
        std::println(stderr, "Error: {}", canonical.error().message);
        return kExitError;
    }
    std::println("{}", *canonical);
    return kExitOk;
}

int cmd_registry(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_registry_help();
        return kExitOk;
    }
    const std::filesystem::path schema_dir(options->schema_dir);
    std::filesystem::path registry_path = options->registry;
    if (registry_path.empty()) {
        if (options->config.empty()) {
            std::println(stderr, "Error: --config or --registry is required");
            print_registry_help();
            return kExitError;
        }
        auto config = cverify::config::load_config(options->config, schema_dir);
        if (!config) {
            std::println(stderr, "Error: {}", config.error().message);
            return kExitError;
        }
        registry_path = config->registry;
    }
    auto snapshot = cverify::registry::load_registry(registry_path, schema_dir);
    if (!snapshot) {
        std::println(stderr, "Error: {}", snapshot.error().message);
        return kExitError;
    }

    std::println("Licenses:");
    for (const auto& license : snapshot->licenses()) {
        if (license.permitted_languages.empty()) {
            std::println("  {} (any language)", license.name);
            continue;
        }
        std::string permitted;
        for (const auto& language : license.permitted_languages) {
            permitted += permitted.empty() ? language : ", " + language;
        }
        std::println("  {} ({})", license.name, permitted);
    }
    std::println("Languages:");
    for (const auto& language : snapshot->languages()) {
        std::println("  {} r{}{}: {} {} -> {} [{}]",
                     language.name,
                     language.revision,
                     language.retired ? " (retired)" : "",
                     language.toolchain.id,
                     language.toolchain.version,
                     language.toolchain.artifact,
                     cverify::registry::format_name(language.toolchain.format));
    }
    return kExitOk;
}

[[nodiscard]] cverify::Result<cverify::Bytes> read_module(const std::string& path)
{
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return cverify::Bytes(text->begin(), text->end());
}

int cmd_cid(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_cid_help();
        return kExitOk;
    }
    if (options->positional.size() != 1) {
        std::println(stderr, "Error: exactly one FILE is required");
        print_cid_help();
        return kExitError;
    }
    auto format = cverify::registry::parse_format(options->format);
    if (!format) {
        std::println(stderr, "Error: unknown format: {}", options->format);
        return kExitError;
    }
    auto bytes = read_module(options->positional.front());
    if (!bytes) {
        std::println(stderr, "Error: {}", bytes.error().message);
        return kExitError;
    }
    auto canonical = cverify::compiler::canonicalize_artifact(*bytes, *format);
    if (!canonical) {
        std::println(stderr, "Error: {}", canonical.error().message);
        return kExitError;
    }
    std::println("{}", cverify::cid::compute_cid(*canonical));
    return kExitOk;
}

int cmd_exports(std::span<char*> args)
{
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_exports_help();
        return kExitOk;
    }
    if (options->positional.size() != 1) {
        std::println(stderr, "Error: exactly one FILE is required");
        print_exports_help();
        return kExitError;
    }
    auto bytes = read_module(options->positional.front());
    if (!bytes) {
        std::println(stderr, "Error: {}", bytes.error().message);
        return kExitError;
    }
    auto exports = cverify::wasm::list_exports(*bytes);
    if (!exports) {
        std::println(stderr, "Error: {}", exports.error().message);
        return kExitError;
    }
    for (const auto& name : *exports) {
        std::println("{}", name);
    }
    return kExitOk;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        auto sub_args = std::span<char*>(argv + 2, static_cast<std::size_t>(argc - 2));

        if (cmd == "submit") {
            return cmd_submit(sub_args);
        }
        if (cmd == "status") {
            return cmd_status(sub_args, false);
        }
        if (cmd == "show") {
            return cmd_status(sub_args, true);
        }
        if (cmd == "files") {
            return cmd_files(sub_args);
        }
        if (cmd == "sweep") {
            return cmd_sweep(sub_args);
        }
        if (cmd == "registry") {
            return cmd_registry(sub_args);
        }
        if (cmd == "cid") {
            return cmd_cid(sub_args);
        }
        if (cmd == "exports") {
            return cmd_exports(sub_args);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
    } catch (const std::exception& ex) {
        std::println(stderr, "Error: {}", ex.what());
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
