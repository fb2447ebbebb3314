#include "xfer/config/options.hpp"
#include "xfer/core/error.hpp"
#include "xfer/events/components.hpp"
#include "xfer/events/event_bus.hpp"
#include "xfer/events/events.hpp"
#include "xfer/io/locations.hpp"
#include "xfer/transfer/buffer_sizer.hpp"
#include "xfer/transfer/engine.hpp"
#include "xfer/transfer/metrics.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>

using namespace xfer;

namespace {

int report_failure(const Error& error) {
    spdlog::error("{}", error.describe());
    spdlog::error("Transfer failed");
    return exit_code(error.kind);
}

int run_transfer(const config::ResolvedOptions& options) {
    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    std::optional<events::ProgressComponent> progress;
    if (options.show_progress) {
        progress.emplace(event_bus);
    }

    // Outlives every S3 client built below
    std::optional<io::AwsSdkScope> aws_sdk;
    if (options.source.kind == io::SourceKind::Object) {
        aws_sdk.emplace();
    }

    auto source = io::open_source(options.source, options.object_store);
    if (source.is_error()) {
        return report_failure(source.error());
    }

    auto sink = io::make_sink(options.sink, options.max_write_size);
    transfer::SinkSession session(*sink);
    if (auto opened = session.open(); opened.is_error()) {
        return report_failure(opened.error());
    }

    transfer::TransferEngine engine;
    if (auto started = engine.start(*source.value(), session.sink(), options.chunk_size);
        started.is_error()) {
        return report_failure(started.error());
    }

    events::TransferStartedEvent started_event;
    started_event.source = source.value()->describe();
    started_event.destination = session.sink().describe();
    started_event.total_bytes = engine.spec().total_length;
    started_event.requested_chunk_size = options.chunk_size;
    started_event.chunk_size = engine.spec().chunk_size;
    started_event.max_operation_size = session.sink().max_operation_size();
    event_bus.emit(started_event);

    const transfer::ProgressCallback forward = [&event_bus](const transfer::ProgressEvent& event) {
        event_bus.emit(events::ChunkWrittenEvent{event});
    };

    for (;;) {
        auto done = engine.step(forward);
        if (done.is_error()) {
            event_bus.emit(events::TransferFailedEvent{done.error(), engine.counters()});
            return report_failure(done.error());
        }
        if (done.value()) {
            break;
        }
    }

    auto result = engine.finish();
    if (result.is_error()) {
        return report_failure(result.error());
    }

    // Data is only durable once the destination handle closes cleanly
    if (auto closed = session.close(); closed.is_error()) {
        event_bus.emit(events::TransferFailedEvent{closed.error(), engine.counters()});
        return report_failure(closed.error());
    }

    event_bus.emit(events::TransferCompletedEvent{result.value()});

    for (const auto& line : transfer::summary_lines(result.value())) {
        spdlog::info("{}", line);
    }
    if (options.json_summary) {
        std::cout << transfer::to_json(result.value()).dump(2) << std::endl;
    }

    spdlog::info("=== SUCCESS ===");
    spdlog::info("Transferred {} to {}", started_event.source, started_event.destination);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? argv[0] : "xfer";

    auto parsed = config::parse_arguments(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().describe());
        std::cerr << config::usage(program);
        return exit_code(parsed.error().kind);
    }
    if (parsed.value().show_help) {
        std::cout << config::usage(program);
        return 0;
    }

    auto resolved = config::resolve(parsed.value());
    if (resolved.is_error()) {
        spdlog::error("{}", resolved.error().describe());
        return exit_code(resolved.error().kind);
    }

    spdlog::set_level(resolved.value().log_level);
    spdlog::info("Write size: {} bytes ({})", resolved.value().chunk_size,
                 transfer::format_size(static_cast<double>(resolved.value().chunk_size)));

    return run_transfer(resolved.value());
}
