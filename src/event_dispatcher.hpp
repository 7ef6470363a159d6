#ifndef STOMP_EVENT_DISPATCHER_HPP
#define STOMP_EVENT_DISPATCHER_HPP

#include "stomp/events.hpp"
#include "stomp/types.hpp"
#include <exception>
#include <functional>
#include <iostream>
#include <utility>
#include <vector>

namespace stomp {
namespace internal {

/// Ordered list of listeners for one event signature
template <typename... Args>
class ListenerList {
public:
    using Listener = std::function<void(Args...)>;

    void Add(ListenerId id, Listener listener) {
        listeners_.emplace_back(id, std::move(listener));
    }

    bool Remove(ListenerId id) {
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Invoke every listener in registration order
    /// Iterates over a snapshot so listeners may register or remove listeners.
    void Emit(Event event, const Args&... args) const {
        auto snapshot = listeners_;
        for (const auto& [id, listener] : snapshot) {
            try {
                listener(args...);
            } catch (const std::exception& e) {
                std::cerr << "Error in " << ToString(event) << " listener: " << e.what() << std::endl;
            }
        }
    }

    void Clear() { listeners_.clear(); }

private:
    std::vector<std::pair<ListenerId, Listener>> listeners_;
};

/// Fan-out of client events to registered listeners
class EventDispatcher {
public:
    ListenerId OnSendFrame(SendFrameListener listener) { return Register(send_frame_, std::move(listener)); }
    ListenerId OnConnected(ConnectedListener listener) { return Register(connected_, std::move(listener)); }
    ListenerId OnMessage(MessageListener listener) { return Register(message_, std::move(listener)); }
    ListenerId OnReceipt(ReceiptListener listener) { return Register(receipt_, std::move(listener)); }
    ListenerId OnError(ErrorListener listener) { return Register(error_, std::move(listener)); }
    ListenerId OnDisconnected(DisconnectedListener listener) { return Register(disconnected_, std::move(listener)); }
    ListenerId OnProtocolError(ProtocolErrorListener listener) { return Register(protocol_error_, std::move(listener)); }

    bool Remove(ListenerId id) {
        return send_frame_.Remove(id) || connected_.Remove(id) || message_.Remove(id) ||
               receipt_.Remove(id) || error_.Remove(id) || disconnected_.Remove(id) ||
               protocol_error_.Remove(id);
    }

    void EmitSendFrame(const std::string& raw_frame) const { send_frame_.Emit(Event::SendFrame, raw_frame); }
    void EmitConnected(const HeaderMap& headers) const { connected_.Emit(Event::Connected, headers); }
    void EmitMessage(const HeaderMap& headers, const std::string& body) const { message_.Emit(Event::Message, headers, body); }
    void EmitReceipt(const HeaderMap& headers) const { receipt_.Emit(Event::Receipt, headers); }
    void EmitError(const HeaderMap& headers, const std::string& body) const { error_.Emit(Event::Error, headers, body); }
    void EmitDisconnected() const { disconnected_.Emit(Event::Disconnected); }
    void EmitProtocolError(int code, const std::string& message) const { protocol_error_.Emit(Event::ProtocolError, code, message); }

    /// Drop every listener
    void Clear() {
        send_frame_.Clear();
        connected_.Clear();
        message_.Clear();
        receipt_.Clear();
        error_.Clear();
        disconnected_.Clear();
        protocol_error_.Clear();
    }

private:
    template <typename List, typename Listener>
    ListenerId Register(List& list, Listener listener) {
        ListenerId id = next_id_++;
        list.Add(id, std::move(listener));
        return id;
    }

    ListenerId next_id_ = 1;
    ListenerList<const std::string&> send_frame_;
    ListenerList<const HeaderMap&> connected_;
    ListenerList<const HeaderMap&, const std::string&> message_;
    ListenerList<const HeaderMap&> receipt_;
    ListenerList<const HeaderMap&, const std::string&> error_;
    ListenerList<> disconnected_;
    ListenerList<int, const std::string&> protocol_error_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_EVENT_DISPATCHER_HPP
