// === Query Events ============================================================
//
// Event model emitted by LiveQuery and the sink interface consumers implement.
// Sinks are invoked synchronously while the query holds its lock, so they must
// return quickly and must not call back into the emitting query.
// `QueryEventQueue` is a thread-safe FIFO sink for consumers that prefer to
// drain events from their own thread.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "geo_query/document_store.hpp"
#include "geo_query/types.hpp"

namespace geo_query {

enum class QueryEventKind : std::uint8_t {
    Entered,  /**< Key moved into the circle (or was first seen inside it). */
    Exited,   /**< Key left the circle or was removed while inside. */
    Changed,  /**< Key inside the circle was updated. */
    Moved,    /**< Key inside the circle changed coordinate; always followed by Changed. */
    Error,    /**< A subscription reported an error. */
    Ready     /**< Every subscription has delivered its first result. */
};

[[nodiscard]] std::string_view to_string(QueryEventKind kind) noexcept;

using EventKindMask = std::uint8_t;

[[nodiscard]] constexpr EventKindMask event_mask(QueryEventKind kind) noexcept {
    return static_cast<EventKindMask>(1U << static_cast<unsigned>(kind));
}

inline constexpr EventKindMask k_all_event_kinds{0x3F};

/** @brief Single notification delivered to sinks. */
struct QueryEvent final {
    QueryEventKind kind{QueryEventKind::Ready};
    std::string key{};                    /**< Document key; empty for Error and Ready. */
    std::optional<GeoPoint> location{};   /**< New location for Entered/Moved/Changed. */
    std::optional<Document> document{};   /**< Last delivered document for key events. */
    std::string str_error{};              /**< Message for Error events. */
};

/** @brief Consumer interface for live query events. */
class QueryEventSink {
  public:
    virtual ~QueryEventSink() = default;

    virtual void on_event(const QueryEvent& event) = 0;
};

using QueryEventSinkPtr = std::shared_ptr<QueryEventSink>;

/** @brief Thread-safe FIFO used to hand events to another thread. */
class QueryEventQueue final : public QueryEventSink {
  public:
    void on_event(const QueryEvent& event) override;
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<QueryEvent> try_consume();
    [[nodiscard]] std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::queue<QueryEvent> queue_events_;
};

/** @brief Adapts a callable to the sink interface. */
class CallbackSink final : public QueryEventSink {
  public:
    using Callback = std::function<void(const QueryEvent&)>;

    explicit CallbackSink(Callback callback);

    void on_event(const QueryEvent& event) override;

  private:
    Callback callback_;
};

}  // namespace geo_query
