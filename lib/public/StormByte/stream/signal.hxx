#pragma once

#include <StormByte/stream/typedefs.hxx>

#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

/**
 * @namespace Stream
 * @brief Namespace for chunked streaming components in the StormByte library.
 *
 * The Stream namespace provides readable, writable, duplex and transform
 * streams with bounded buffering and backpressure, plus the coordinators
 * that pipe them together.
 */
namespace StormByte::Stream {
	/**
	 * @class Signal
	 * @brief Typed list of event listeners.
	 *
	 * @par Overview
	 *  Each stream event (data, drain, end, finish, error, close...) is one
	 *  Signal. Listeners are called in registration order. Registration
	 *  does not transfer ownership of anything but the handler itself.
	 *
	 * @par Reentrancy
	 *  Emit() iterates over a snapshot, so listeners may connect or disconnect
	 *  listeners while being called. A listener disconnected during an
	 *  emission is not called anymore, even by that same emission; a listener
	 *  connected during an emission is first called by the next one.
	 *
	 * @tparam Args Arguments passed to every listener.
	 */
	template<typename... Args>
	class Signal final {
		public:
			using Handler = std::function<void(Args...)>;			///< Listener signature.

			Signal() noexcept										= default;
			Signal(const Signal&)									= delete;
			Signal(Signal&&) noexcept								= default;
			~Signal() noexcept										= default;
			Signal& operator=(const Signal&)						= delete;
			Signal& operator=(Signal&&) noexcept					= default;

			/**
			 * @brief Remove every listener.
			 */
			inline void 											Clear() noexcept {
				for (auto& slot: m_slots)
					slot->active = false;
				m_slots.clear();
			}

			/**
			 * @brief Register a listener.
			 * @param id Identifier used later to disconnect it.
			 * @param handler Listener to call on Emit().
			 */
			inline void 											Connect(const ListenerId& id, Handler&& handler) {
				m_slots.push_back(std::make_shared<Slot>(id, std::move(handler)));
			}

			/**
			 * @brief Number of registered listeners.
			 */
			inline std::size_t 										Count() const noexcept {
				return m_slots.size();
			}

			/**
			 * @brief Remove the listener registered under @p id.
			 * @param id Listener identifier.
			 * @return true if the listener belonged to this signal.
			 */
			inline bool 											Disconnect(const ListenerId& id) noexcept {
				auto it = std::find_if(m_slots.begin(), m_slots.end(), [&id](const auto& slot) {
					return slot->id == id;
				});
				if (it == m_slots.end())
					return false;
				(*it)->active = false;
				m_slots.erase(it);
				return true;
			}

			/**
			 * @brief Call every listener with @p args.
			 * @param args Arguments forwarded by const reference.
			 */
			inline void 											Emit(const Args&... args) const {
				const auto snapshot = m_slots;
				for (const auto& slot: snapshot) {
					if (slot->active)
						slot->handler(args...);
				}
			}

			/**
			 * @brief Check whether no listener is registered.
			 */
			inline bool 											Empty() const noexcept {
				return m_slots.empty();
			}

		private:
			struct Slot {
				inline Slot(const ListenerId& slot_id, Handler&& slot_handler):
					id(slot_id), handler(std::move(slot_handler)) {}

				ListenerId id;
				Handler handler;
				bool active {true};
			};

			std::vector<std::shared_ptr<Slot>> m_slots;				///< Registered listeners.
	};
}
