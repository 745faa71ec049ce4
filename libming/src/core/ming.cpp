/**
 * @file ming.cpp
 * @brief Implementation of the public Converter API.
 */

#include "../../include/ming.hpp"

#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

#include <atomic>

namespace ming {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ConverterObserver* observer_;
public:
    explicit BridgeLogSink(ConverterObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(level, std::string(message), std::string(tag));
        }
    }
};

struct Converter::Impl {
    ConversionOptions options;
    ConverterObserver* observer = nullptr;
    std::atomic<ConversionOrchestrator*> current = nullptr;

    void bridge_events(EventBus& bus) const {
        if (!observer) return;
        ConverterObserver* obs = observer;

        bus.subscribe<InputStartEvent>([obs](const InputStartEvent& e) {
            obs->onInputStart(e.path);
        });

        bus.subscribe<PdfCreatedEvent>([obs](const PdfCreatedEvent& e) {
            obs->onPdfCreated(e.output, e.pages);
        });

        bus.subscribe<ConversionErrorEvent>([obs](const ConversionErrorEvent& e) {
            obs->onError(e.error.path, e.error.message);
        });
    }
};

/**
 * @brief Keeps the bridge sink registered for the duration of one run.
 */
class ScopedBridgeSink {
    const ILogSink* sink_ = nullptr;
public:
    explicit ScopedBridgeSink(ConverterObserver* observer) {
        if (observer) {
            auto sink = std::make_unique<BridgeLogSink>(observer);
            sink_ = sink.get();
            Logger::add_sink(std::move(sink));
        }
    }
    ~ScopedBridgeSink() {
        if (sink_) Logger::remove_sink(sink_);
    }
    ScopedBridgeSink(const ScopedBridgeSink&) = delete;
    ScopedBridgeSink& operator=(const ScopedBridgeSink&) = delete;
};

Converter::Converter() : impl_(std::make_unique<Impl>()) {}

Converter::~Converter() {
    if (impl_) stop();
}

Converter::Converter(Converter&&) noexcept = default;
Converter& Converter::operator=(Converter&&) noexcept = default;

Converter& Converter::outputDirectory(const std::filesystem::path& dir) {
    impl_->options.output_dir = dir;
    return *this;
}

Converter& Converter::deleteSources(const bool val) {
    impl_->options.delete_sources = val;
    return *this;
}

void Converter::setObserver(ConverterObserver* observer) {
    impl_->observer = observer;
}

ConversionResult Converter::convert(const std::vector<std::filesystem::path>& paths) {
    EventBus bus;
    impl_->bridge_events(bus);
    ScopedBridgeSink bridge(impl_->observer);

    ConversionOrchestrator orchestrator(impl_->options, bus);

    impl_->current.store(&orchestrator);
    struct ResetCurrent {
        std::atomic<ConversionOrchestrator*>& ref;
        ~ResetCurrent() { ref.store(nullptr); }
    } reset{impl_->current};

    return orchestrator.run(paths);
}

ConversionResult Converter::convert(const std::filesystem::path& path) {
    return convert(std::vector<std::filesystem::path>{path});
}

void Converter::stop() {
    auto* orchestrator = impl_->current.load();
    if (orchestrator) {
        orchestrator->request_stop();
    }
}

} // namespace ming
