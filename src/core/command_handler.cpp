#include "assetrelay/core/command_handler.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/utils.hpp"
#include "assetrelay/network/github_release_sink.hpp"
#include "assetrelay/network/url_reader.hpp"
#include "assetrelay/storage/pipeline_config.hpp"
#include "assetrelay/storage/resume_journal.hpp"
#include "assetrelay/transfer/chunked_reader.hpp"
#include "assetrelay/transfer/transfer_manager.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <memory>

namespace assetrelay::core {

namespace {

using network::GithubReleaseSink;
using network::GithubSinkOptions;
using network::ReleaseInfo;
using transfer::TransferStatus;

bool interrupted(const CommandContext& context) {
    return context.interrupted && context.interrupted->load();
}

CommandResult open_release(CommandContext& context, std::unique_ptr<GithubReleaseSink>& sink,
                           ReleaseInfo& release) {
    auto options = GithubSinkOptions::from_config(context.config);
    if (options.repo.empty()) {
        return CommandResult::usage("github.repo is not set (config file or GITHUB_REPO)");
    }
    if (options.token.empty()) {
        return CommandResult::usage("github.token is not set (config file or GITHUB_TOKEN)");
    }

    auto tag = context.config.get_string("github.release_tag");
    if (tag.empty()) {
        return CommandResult::usage("No release tag given (--release-tag or GITHUB_RELEASE_TAG)");
    }

    try {
        sink = std::make_unique<GithubReleaseSink>(std::move(options));
    } catch (const std::invalid_argument& e) {
        return CommandResult::usage(e.what());
    }

    auto result = sink->resolve_release(tag, release);
    if (!result) {
        return CommandResult::error(result.describe());
    }
    LOG_DEBUG("Release {} resolved to id {}", tag, release.id);
    return CommandResult::ok();
}

CommandResult report_outcome(CommandContext& context, const transfer::TransferState& state) {
    if (state.status == TransferStatus::CANCELLED) {
        return CommandResult::cancelled();
    }
    if (state.status != TransferStatus::COMPLETED || !state.result) {
        return CommandResult::error(state.last_error ? state.last_error->describe()
                                                     : std::string("Transfer failed"));
    }

    auto& out = *context.out;
    const auto& outcome = *state.result;
    out << "Uploaded " << utils::StringUtils::format_bytes(outcome.total_bytes) << " in "
        << state.parts_completed.size() << (state.parts_completed.size() == 1 ? " asset" : " assets");
    if (state.total_retries > 0) {
        out << " (" << state.total_retries << " retries)";
    }
    out << "\n";

    for (const auto& part : state.parts_completed) {
        out << "  " << std::left << std::setw(40) << part.asset_name
            << std::setw(12) << utils::StringUtils::format_bytes(part.range.length());
        if (part.sink_asset_id) {
            out << "id " << *part.sink_asset_id;
        }
        if (part.resumed) {
            out << " (resumed)";
        }
        out << "\n";
        if (!part.download_url.empty()) {
            out << "    " << part.download_url << "\n";
        }
    }
    return CommandResult::ok("Transfer completed");
}

CommandResult run_transfer(CommandContext& context, transfer::TransferRequest request) {
    auto pipeline = storage::PipelineConfig::from_config(context.config);
    if (auto problem = pipeline.validation_error()) {
        return CommandResult::usage("Invalid configuration: " + *problem);
    }

    std::unique_ptr<GithubReleaseSink> sink;
    ReleaseInfo release;
    auto opened = open_release(context, sink, release);
    if (!opened.success) {
        return opened;
    }
    request.target_release_id = release.id;
    request.declared_size_bytes = context.declared_size;
    request.replace_existing = context.replace_existing;
    request.label = context.label;

    std::unique_ptr<storage::ResumeJournal> journal;
    if (!pipeline.resume_database.empty()) {
        journal = std::make_unique<storage::ResumeJournal>(pipeline.resume_database);
        if (journal->initialize()) {
            journal->cleanup_old_entries();
        } else {
            LOG_WARN("Resume journal {} unavailable; continuing without it",
                     pipeline.resume_database.string());
            journal.reset();
        }
    }

    transfer::TransferManager manager(*sink, pipeline);
    auto http_options = sink->get_options().http;
    manager.set_reader_factory([http_options](const std::string& url) {
        return std::make_unique<network::UrlReader>(url, http_options);
    });
    manager.set_resume_journal(journal.get());

    auto* err = context.err;
    auto progress = [err](const transfer::ProgressEvent& event) {
        *err << transfer::describe_progress(event) << "\n";
    };

    transfer::SessionHandle handle;
    auto started = manager.start(std::move(request), progress, handle);
    if (!started) {
        return started.error == TransferError::INVALID_REQUEST
            ? CommandResult::usage(started.describe())
            : CommandResult::error(started.describe());
    }

    bool cancel_requested = false;
    std::optional<transfer::TransferState> state;
    while (!(state = manager.wait_for(handle, std::chrono::milliseconds(200)))) {
        if (!cancel_requested && interrupted(context)) {
            LOG_INFO("Interrupt received, cancelling {}", handle);
            auto cancelled = manager.cancel(handle);
            if (!cancelled) {
                LOG_DEBUG("Cancel of {} ignored: {}", handle, cancelled.describe());
            }
            cancel_requested = true;
        }
    }

    return report_outcome(context, *state);
}

}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return CommandResult::usage("Usage: " + get_usage());
    }

    const std::string& path = args[1];
    transfer::InlineStream stream;
    std::string asset_name;

    if (path == "-") {
        if (args.size() < 3) {
            return CommandResult::usage("An asset name is required when reading stdin");
        }
        asset_name = args[2];
        stream.reader = std::make_shared<transfer::StreamReader>(std::cin, context_.declared_size, "stdin");
    } else {
        std::filesystem::path file_path = utils::FileUtils::expand_user(path);
        if (!utils::FileUtils::is_file(file_path.string())) {
            return CommandResult::error("File does not exist: " + file_path.string());
        }
        asset_name = args.size() == 3 ? args[2] : file_path.filename().string();
        stream.reader = std::make_shared<transfer::FileReader>(file_path);
    }

    LOG_INFO("Uploading {} as {}", path == "-" ? "stdin" : path, asset_name);

    transfer::TransferRequest request;
    request.source = stream;
    request.target_asset_name = asset_name;
    return run_transfer(context_, std::move(request));
}

CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return CommandResult::usage("Usage: " + get_usage());
    }

    const std::string& url = args[1];
    if (!network::Url::parse(url)) {
        return CommandResult::usage("Not an http(s) URL: " + url);
    }

    transfer::TransferRequest request;
    request.source = transfer::RemoteUrl{url};
    request.target_asset_name = args.size() == 3
        ? args[2]
        : utils::StringUtils::filename_from_url(url, std::chrono::system_clock::now());

    LOG_INFO("Fetching {} as {}", url, request.target_asset_name);
    return run_transfer(context_, std::move(request));
}

CommandResult AssetsCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult::usage("Usage: " + get_usage());
    }

    std::unique_ptr<GithubReleaseSink> sink;
    ReleaseInfo release;
    auto opened = open_release(context_, sink, release);
    if (!opened.success) {
        return opened;
    }

    std::vector<network::AssetInfo> assets;
    auto result = sink->list_assets(release.id, assets);
    if (!result) {
        return CommandResult::error(result.describe());
    }

    auto& out = *context_.out;
    out << "Release " << release.tag_name << " (" << assets.size() << " assets):\n";
    for (const auto& asset : assets) {
        out << "  " << std::left << std::setw(40) << asset.name
            << std::setw(12) << utils::StringUtils::format_bytes(asset.size)
            << "id " << asset.id << "\n";
    }
    return CommandResult::ok();
}

CommandResult DeleteCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::usage("Usage: " + get_usage());
    }

    std::unique_ptr<GithubReleaseSink> sink;
    ReleaseInfo release;
    auto opened = open_release(context_, sink, release);
    if (!opened.success) {
        return opened;
    }

    std::optional<network::AssetInfo> asset;
    auto result = sink->find_asset(release.id, args[1], asset);
    if (!result) {
        return CommandResult::error(result.describe());
    }
    if (!asset) {
        return CommandResult::error("No asset named " + args[1] + " in release " + release.tag_name);
    }

    result = sink->delete_asset(asset->id);
    if (!result) {
        return CommandResult::error(result.describe());
    }

    *context_.out << "Deleted " << asset->name << " (id " << asset->id << ")\n";
    return CommandResult::ok();
}

}
