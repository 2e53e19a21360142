#include "MessageDispatcher.hpp"
#include "MessageParser.hpp"
#include "WorkerPool.hpp"
#include "../errors/MarketDataErrors.hpp"
#include "StreamMonitor.hpp"
#include "TaplineLogging.hpp"
#include <algorithm>
#include <format>

MessageDispatcher::MessageDispatcher(WorkerPool& pool,
                                     StreamMonitor* monitor,
                                     std::size_t malformedThreshold,
                                     std::chrono::milliseconds malformedWindow)
    : m_pool(pool)
    , m_monitor(monitor)
    , m_breaker(malformedThreshold, malformedWindow)
    , m_table(std::make_shared<const Table>())
{}

MessageDispatcher::HandlerId MessageDispatcher::registerHandler(EventKind kind, Handler handler) {
    std::lock_guard<std::mutex> lock(m_tableMx);
    auto next = std::make_shared<Table>(*m_table);
    const HandlerId id = m_nextId++;
    next->push_back(Entry{id, kind, std::move(handler)});
    m_table = std::move(next);
    return id;
}

bool MessageDispatcher::removeHandler(HandlerId id) {
    std::lock_guard<std::mutex> lock(m_tableMx);
    auto next = std::make_shared<Table>(*m_table);
    auto it = std::remove_if(next->begin(), next->end(), [id](const Entry& e) { return e.id == id; });
    if (it == next->end()) {
        return false;
    }
    next->erase(it, next->end());
    m_table = std::move(next);
    return true;
}

std::size_t MessageDispatcher::handlerCount() const {
    return table()->size();
}

std::shared_ptr<const MessageDispatcher::Table> MessageDispatcher::table() const {
    std::lock_guard<std::mutex> lock(m_tableMx);
    return m_table;
}

void MessageDispatcher::setControlListener(ControlListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMx);
    m_control = std::move(listener);
}

void MessageDispatcher::setBreakerListener(BreakerListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMx);
    m_onBreaker = std::move(listener);
}

void MessageDispatcher::onFrame(const std::string& raw, std::chrono::system_clock::time_point receivedAt) {
    m_frames.fetch_add(1, std::memory_order_relaxed);
    if (m_monitor) m_monitor->recordFrame();

    MarketEventPtr ev;
    try {
        ev = std::make_shared<const MarketEvent>(MessageParser::parse(raw, receivedAt));
    } catch (const MalformedFrame& e) {
        m_malformed.fetch_add(1, std::memory_order_relaxed);
        if (m_monitor) m_monitor->recordMalformed();
        tLog_DataN(10, "⚠️ Dropping malformed frame:" << e.what());

        if (m_breaker.record()) {
            BreakerListener cb;
            {
                std::lock_guard<std::mutex> lock(m_listenerMx);
                cb = m_onBreaker;
            }
            tLog_Warning("❌ Malformed-frame threshold reached; forcing reconnect");
            if (cb) cb("malformed frame threshold reached");
        }
        return;
    }

    const EventKind kind = ev->kind();
    if (m_monitor) m_monitor->recordEvent(kind);

    if (kind == EventKind::Ack || kind == EventKind::Error) {
        ControlListener cb;
        {
            std::lock_guard<std::mutex> lock(m_listenerMx);
            cb = m_control;
        }
        if (cb) cb(ev);
    } else if (kind == EventKind::Unknown) {
        m_unknown.fetch_add(1, std::memory_order_relaxed);
        if (m_monitor) m_monitor->recordUnknown();
        tLog_Debug("Unknown message type:" << QString::fromStdString(std::get<UnknownEvent>(ev->body).type));
    }

    dispatchToHandlers(ev);
}

void MessageDispatcher::dispatchToHandlers(const MarketEventPtr& ev) {
    auto tbl = table();
    const EventKind kind = ev->kind();
    const bool any = std::any_of(tbl->begin(), tbl->end(), [kind](const Entry& e) { return e.kind == kind; });
    if (!any) {
        return;
    }

    auto task = [tbl, ev, kind]() {
        for (const auto& e : *tbl) {
            if (e.kind != kind) continue;
            try {
                e.fn(ev);
            } catch (const std::exception& ex) {
                tLog_Warning(QString::fromStdString(
                    std::format("❌ Handler for {} threw: {}", toString(kind), ex.what())));
            }
        }
    };

    if (ev->header.sid != 0) {
        m_pool.submit(static_cast<std::size_t>(ev->header.sid), std::move(task));
    } else {
        m_pool.submit(std::string_view(ev->header.instrument), std::move(task));
    }
}
