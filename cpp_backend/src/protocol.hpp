#pragma once

#include <boost/json.hpp>
#include <string>

#include "events.hpp"
#include "world.hpp"

// JSON wire format shared by the WebSocket stream and the HTTP API.
namespace soulwar::protocol {

boost::json::object soul_json(const SoulView& soul);
boost::json::object orb_json(const EnergyOrb& orb);
boost::json::object nexus_json(const Nexus& nexus);
boost::json::object spell_json(const ActiveSpell& spell);
boost::json::object buff_json(const Buff& buff);

// Payload of one event, without the type wrapper.
boost::json::object event_data(const Event& ev);

// {"type": <event type>, "data": {...}}
boost::json::object event_message(const Event& ev);

boost::json::object world_state(const WorldSnapshot& snap);
boost::json::object world_state_message(const WorldSnapshot& snap);

// Compact summary served at /api/status.
boost::json::object status(const WorldSnapshot& snap);

// The "type" field of an inbound message, or empty when the text is not a
// JSON object carrying one.
std::string message_type(const std::string& text);

}  // namespace soulwar::protocol
