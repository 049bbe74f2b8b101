//
// Created by Giuseppe Francione on 17/02/26.
//

/**
 * @file folio.cpp
 * @brief Implementation of the public Folio API.
 */

#include "../../include/folio.hpp"

#include "../../include/codec_registry.hpp"
#include "../../include/document_inspector.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdfium_service.hpp"
#include "../../include/progress.hpp"
#include "../../include/qpdf_engine.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace folio {

namespace {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    FolioObserver* observer_;
public:
    explicit BridgeLogSink(FolioObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->on_log(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

} // namespace

struct Folio::Impl {
    std::unique_ptr<IPdfEngine> engine;
    FileArtifactSink sink;
    CodecRegistry codecs;
    EventBus event_bus;

    FolioObserver* observer = nullptr;
    std::vector<EventBus::SubscriptionId> subscriptions;
    std::optional<ScopedLogSink> bridge;

    explicit Impl(std::unique_ptr<IPdfEngine> e) : engine(std::move(e)) {}

    ~Impl() { detach(); }

    void detach() {
        for (const auto id : subscriptions) {
            event_bus.unsubscribe(id);
        }
        subscriptions.clear();
        bridge.reset();
        observer = nullptr;
    }

    void attach(FolioObserver* obs) {
        detach();
        if (!obs) return;
        observer = obs;

        subscriptions.push_back(event_bus.subscribe<OperationStartEvent>([this](const OperationStartEvent& e) {
            observer->on_start(e.operation, e.input);
        }));
        subscriptions.push_back(event_bus.subscribe<ProgressEvent>([this](const ProgressEvent& e) {
            observer->on_progress(e.operation, e.current, e.total, e.context);
        }));
        subscriptions.push_back(event_bus.subscribe<OperationCompleteEvent>([this](const OperationCompleteEvent& e) {
            observer->on_finish(e.operation, e.duration);
        }));
        subscriptions.push_back(event_bus.subscribe<OperationErrorEvent>([this](const OperationErrorEvent& e) {
            observer->on_error(e.operation, e.error_message);
        }));

        // static logs reach the observer through this sink until detach()
        bridge.emplace(std::make_unique<BridgeLogSink>(obs));
    }

    /**
     * @brief Runs @p fn as operation @p name, publishing start, completion or error.
     */
    template <typename Fn>
    auto run(const std::string& name, const std::filesystem::path& input, Fn&& fn) {
        event_bus.publish(OperationStartEvent{name, input.string()});
        EventBusProgressReporter progress(event_bus, name);
        const auto start = std::chrono::steady_clock::now();
        try {
            if constexpr (std::is_void_v<decltype(fn(progress))>) {
                fn(progress);
                publish_complete(name, start);
            } else {
                auto result = fn(progress);
                publish_complete(name, start);
                return result;
            }
        } catch (const std::exception& e) {
            event_bus.publish(OperationErrorEvent{name, describe_error(e)});
            throw;
        }
    }

    void publish_complete(const std::string& name, const std::chrono::steady_clock::time_point start) {
        event_bus.publish(OperationCompleteEvent{
            name, std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)});
    }
};

Folio::Folio() : Folio(std::make_unique<QpdfEngine>()) {}

Folio::Folio(std::unique_ptr<IPdfEngine> engine) : impl_(std::make_unique<Impl>(std::move(engine))) {}

Folio::~Folio() = default;

Folio::Folio(Folio&&) noexcept = default;
Folio& Folio::operator=(Folio&&) noexcept = default;

void Folio::set_observer(FolioObserver* observer) {
    impl_->attach(observer);
}

std::vector<std::filesystem::path> Folio::split(const SplitRequest& request) {
    return impl_->run("split", request.source.path, [&](IProgressReporter& p) {
        return DocumentAssembler(*impl_->engine, impl_->sink, &p).split(request);
    });
}

MergeSummary Folio::merge(const MergeRequest& request) {
    return impl_->run("merge", request.output, [&](IProgressReporter& p) {
        return DocumentAssembler(*impl_->engine, impl_->sink, &p).merge(request);
    });
}

void Folio::reorder(const ReorderRequest& request) {
    impl_->run("reorder", request.source.path, [&](IProgressReporter& p) {
        DocumentAssembler(*impl_->engine, impl_->sink, &p).reorder(request);
    });
}

void Folio::remove(const RemoveRequest& request) {
    impl_->run("remove", request.source.path, [&](IProgressReporter& p) {
        DocumentAssembler(*impl_->engine, impl_->sink, &p).remove(request);
    });
}

void Folio::insert(const InsertRequest& request) {
    impl_->run("insert", request.source.path, [&](IProgressReporter& p) {
        DocumentAssembler(*impl_->engine, impl_->sink, &p).insert(request);
    });
}

void Folio::rotate(const RotateRequest& request) {
    impl_->run("rotate", request.source.path, [&](IProgressReporter& p) {
        DocumentAssembler(*impl_->engine, impl_->sink, &p).rotate(request);
    });
}

void Folio::unlock(const UnlockRequest& request) {
    impl_->run("unlock", request.source.path, [&](IProgressReporter& p) {
        DocumentAssembler(*impl_->engine, impl_->sink, &p).unlock(request);
    });
}

PdfInfo Folio::info(const SourceDocument& source) {
    return impl_->run("info", source.path, [&](IProgressReporter& p) {
        return DocumentInspector(impl_->sink, &p).info(source);
    });
}

std::vector<BookmarkNode> Folio::bookmarks(const SourceDocument& source) {
    return impl_->run("bookmarks", source.path, [&](IProgressReporter& p) {
        require_source(source, "bookmarks");
        std::lock_guard lock(engine_mutex());
        std::unique_ptr<IPdfDocument> doc;
        try {
            doc = impl_->engine->load_document(source.path, source.password);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "bookmarks: cannot load " + source.path.string() + " (" + e.what() + ")",
                        "folio");
            std::throw_with_nested(OperationError("bookmarks: cannot load " + source.path.string()));
        }
        auto nodes = build_bookmark_index(*doc);
        report_progress(&p, static_cast<int>(nodes.size()), static_cast<int>(nodes.size()));
        return nodes;
    });
}

std::vector<PageText> Folio::text(const SourceDocument& source, const PageRange& range) {
    return impl_->run("text", source.path, [&](IProgressReporter& p) {
        return PdfiumService(impl_->codecs, impl_->sink, &p).extract_text(source, range);
    });
}

std::vector<Attachment> Folio::attachments(const SourceDocument& source) {
    return impl_->run("list-attachments", source.path, [&](IProgressReporter& p) {
        return DocumentInspector(impl_->sink, &p).attachments(source);
    });
}

std::vector<std::filesystem::path> Folio::extract_attachments(const SourceDocument& source,
                                                              const std::filesystem::path& output_dir,
                                                              const std::optional<int> index) {
    return impl_->run("extract-attachments", source.path, [&](IProgressReporter& p) {
        return DocumentInspector(impl_->sink, &p).extract_attachments(source, output_dir, index);
    });
}

std::vector<FormField> Folio::form_fields(const SourceDocument& source, const PageRange& range) {
    return impl_->run("list-forms", source.path, [&](IProgressReporter& p) {
        return DocumentInspector(impl_->sink, &p).form_fields(source, range);
    });
}

std::vector<PageObject> Folio::page_objects(const SourceDocument& source, const PageRange& range) {
    return impl_->run("list-objects", source.path, [&](IProgressReporter& p) {
        return PdfiumService(impl_->codecs, impl_->sink, &p).list_objects(source, range);
    });
}

void Folio::remove_object(const SourceDocument& source, const std::filesystem::path& output,
                          const int page_number, const int object_index) {
    impl_->run("remove-object", source.path, [&](IProgressReporter& p) {
        PdfiumService(impl_->codecs, impl_->sink, &p).remove_object(source, output, page_number, object_index);
    });
}

std::vector<std::filesystem::path> Folio::convert(const SourceDocument& source, const ConvertOptions& options) {
    return impl_->run("convert", source.path, [&](IProgressReporter& p) {
        return PdfiumService(impl_->codecs, impl_->sink, &p).convert(source, options);
    });
}

std::filesystem::path Folio::image_to_pdf(const ImageToPdfRequest& request) {
    return impl_->run("imagetopdf", request.image, [&](IProgressReporter& p) {
        return folio::image_to_pdf(request, impl_->codecs, impl_->sink, &p);
    });
}

void Folio::watermark(const SourceDocument& source, const std::filesystem::path& output,
                      const WatermarkOptions& options, const PageRange& range) {
    impl_->run("watermark", source.path, [&](IProgressReporter& p) {
        PdfiumService(impl_->codecs, impl_->sink, &p).watermark(source, output, options, range);
    });
}

} // namespace folio
