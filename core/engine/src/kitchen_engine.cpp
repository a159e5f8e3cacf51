#include "kds/engine/kitchen_engine.hpp"
#include "kds/kitchen/errors.hpp"
#include "kds/kitchen/escalation_engine.hpp"
#include "kds/network/json_codec.hpp"
#include "kds/settings/settings_json.hpp"
#include "kds/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace kds {

namespace {

nlohmann::json errorReply(const std::string& kind, const std::string& message) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["error"] = kind;
  reply["message"] = message;
  return reply;
}

domain::Trigger parseTrigger(const std::string& name) {
  domain::Trigger trigger;
  if (!domain::triggerFromString(name, trigger)) {
    throw std::invalid_argument("unknown trigger: " + name);
  }
  return trigger;
}

AuditFilter historyFilterFromJson(const nlohmann::json& j) {
  AuditFilter filter;
  if (j.contains("ticket_id")) {
    filter.ticket_id = j.at("ticket_id").get<domain::TicketId>();
  }
  if (j.contains("order_id")) {
    filter.order_id = j.at("order_id").get<std::string>();
  }
  if (j.contains("station_id")) {
    filter.station_id = j.at("station_id").get<std::string>();
  }
  if (j.contains("actor")) {
    filter.actor = j.at("actor").get<std::string>();
  }
  if (j.contains("action")) {
    domain::AuditAction action;
    const auto name = j.at("action").get<std::string>();
    if (!domain::actionFromString(name, action)) {
      throw std::invalid_argument("unknown action: " + name);
    }
    filter.action = action;
  }
  if (j.contains("from_ms")) {
    filter.from_ms = j.at("from_ms").get<domain::TimeMs>();
  }
  if (j.contains("to_ms")) {
    filter.to_ms = j.at("to_ms").get<domain::TimeMs>();
  }
  filter.limit = j.value("limit", std::size_t{0});
  return filter;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: wire components, every sink feeds the notification loop
// -----------------------------------------------------------------------------
KitchenEngine::KitchenEngine(ITicketRepository& repository,
                             const ISettingsProvider& settings,
                             const IStationDirectory& stations,
                             const ITimeProvider& time,
                             std::string ipc_cmd_endpoint,
                             std::string ipc_pub_endpoint)
    : repository_(repository),
      settings_(settings),
      stations_(stations),
      time_(time),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)),
      audit_log_(repository_),
      state_machine_(repository_, audit_log_, locks_, time_,
                     [this](Event e) { notify_loop_.push(std::move(e)); }),
      router_(stations_, state_machine_, ids_, time_,
              [this](Event e) { notify_loop_.push(std::move(e)); }),
      ready_queue_(repository_),
      scheduler_(repository_, state_machine_, settings_, time_,
                 [this](Event e) { notify_loop_.push(std::move(e)); }) {
  // Ids continue after whatever the repository already holds.
  ids_.seed(repository_.highestTicketId());
}

KitchenEngine::~KitchenEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void KitchenEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Notification loop first, so nothing produced below is stranded --
  notify_loop_.start();

  // ---  2) IPC adapter (optional) ------------------------------------------
  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);
    ipc_server_->start();

    telemetry_sub_id_ = notify_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  3) Scheduler last: it starts producing transitions immediately -----
  scheduler_.start();

  running_ = true;

  std::cout << "[KitchenEngine] started. Threads: notify, scheduler"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void KitchenEngine::stop() {
  if (!running_) {
    return;
  }

  scheduler_.stop();

  // The telemetry subscriber runs on the loop thread and calls into
  // ipc_server_, so the server must outlive that thread.
  notify_loop_.stop();

  if (ipc_server_) {
    notify_loop_.eventBus().unsubscribe(telemetry_sub_id_);
    ipc_server_.reset();
  }

  running_ = false;

  std::cout << "[KitchenEngine] stopped. All threads joined.\n";
}

RoutingResult KitchenEngine::intakeOrder(const domain::Order& order) {
  return router_.route(order, settings_.settings(order.hub_id));
}

TicketView KitchenEngine::makeView(const domain::Ticket& ticket,
                                   const domain::KitchenSettings& settings,
                                   domain::TimeMs now) const {
  TicketView view;
  view.ticket = ticket;
  view.elapsed_ms = EscalationEngine::elapsed(ticket, now);
  view.urgency = EscalationEngine::classify(ticket, settings, now);
  view.elapsed_display = formatElapsed(view.elapsed_ms);
  return view;
}

std::vector<TicketView> KitchenEngine::listActive(
    const domain::HubId& hub,
    const std::optional<domain::StationId>& station) const {
  const domain::KitchenSettings settings = settings_.settings(hub);
  const domain::TimeMs now = time_.now_ms();

  std::vector<TicketView> views;
  for (auto state : {domain::TicketState::Received,
                     domain::TicketState::Accepted,
                     domain::TicketState::InProgress}) {
    for (const auto& ticket : repository_.findByState(hub, state, station)) {
      views.push_back(makeView(ticket, settings, now));
    }
  }

  std::sort(views.begin(), views.end(),
            [](const TicketView& a, const TicketView& b) {
              if (a.ticket.priority != b.ticket.priority) {
                return a.ticket.priority > b.ticket.priority;
              }
              if (a.ticket.created_at != b.ticket.created_at) {
                return a.ticket.created_at < b.ticket.created_at;
              }
              return a.ticket.id < b.ticket.id;
            });
  return views;
}

std::vector<domain::Ticket> KitchenEngine::listReady(
    const domain::HubId& hub) const {
  return ready_queue_.list(hub);
}

std::vector<domain::AuditEntry> KitchenEngine::listHistory(
    const domain::HubId& hub, AuditFilter filter) const {
  filter.hub_id = hub;
  if (filter.limit == 0) {
    filter.limit = kDefaultHistoryLimit;
  }
  return audit_log_.history(std::move(filter));
}

TicketCounts KitchenEngine::counts(const domain::HubId& hub) const {
  TicketCounts c;
  c.received = repository_.findByState(hub, domain::TicketState::Received).size();
  c.accepted = repository_.findByState(hub, domain::TicketState::Accepted).size();
  c.in_progress =
      repository_.findByState(hub, domain::TicketState::InProgress).size();
  c.ready = repository_.findByState(hub, domain::TicketState::Bumped).size();
  c.total_active = c.received + c.accepted + c.in_progress;
  return c;
}

domain::KitchenSettings KitchenEngine::settings(const domain::HubId& hub) const {
  return settings_.settings(hub);
}

domain::Ticket KitchenEngine::transition(domain::TicketId id,
                                         domain::Trigger trigger,
                                         const std::string& actor) {
  return state_machine_.apply(id, trigger, actor);
}

domain::Ticket KitchenEngine::changePriority(domain::TicketId id, int priority,
                                             const std::string& actor) {
  return state_machine_.changePriority(id, priority, actor);
}

domain::Ticket KitchenEngine::advance(domain::TicketId id,
                                      const std::string& actor) {
  return state_machine_.advance(id, actor);
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON request -> JSON reply
// -----------------------------------------------------------------------------
std::string KitchenEngine::executeCommand(const std::string& request) {
  nlohmann::json response;

  if (request == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }

  try {
    const auto j = nlohmann::json::parse(request);
    const auto cmd = j.at("cmd").get<std::string>();

    if (cmd == "ping") {
      response["response"] = "PONG";
    } else if (cmd == "intake") {
      RoutingResult result = intakeOrder(orderFromJson(j.at("order")));
      nlohmann::json tickets = nlohmann::json::array();
      for (const auto& t : result.tickets) {
        tickets.push_back(ticketToJson(t));
      }
      nlohmann::json failures = nlohmann::json::array();
      for (const auto& f : result.failures) {
        failures.push_back({{"line_id", f.line_id},
                            {"station_id", f.station_id},
                            {"error", "routing_error"},
                            {"reason", f.reason}});
      }
      response["tickets"] = std::move(tickets);
      response["failures"] = std::move(failures);
    } else if (cmd == "list_active") {
      std::optional<domain::StationId> station;
      if (j.contains("station_id")) {
        station = j.at("station_id").get<std::string>();
      }
      nlohmann::json tickets = nlohmann::json::array();
      for (const auto& view :
           listActive(j.at("hub_id").get<std::string>(), station)) {
        nlohmann::json t = ticketToJson(view.ticket);
        t["elapsed_ms"] = view.elapsed_ms;
        t["elapsed_display"] = view.elapsed_display;
        t["urgency"] = domain::toString(view.urgency);
        tickets.push_back(std::move(t));
      }
      response["tickets"] = std::move(tickets);
    } else if (cmd == "list_ready") {
      nlohmann::json tickets = nlohmann::json::array();
      for (const auto& t : listReady(j.at("hub_id").get<std::string>())) {
        tickets.push_back(ticketToJson(t));
      }
      response["tickets"] = std::move(tickets);
    } else if (cmd == "history") {
      nlohmann::json entries = nlohmann::json::array();
      for (const auto& e : listHistory(j.at("hub_id").get<std::string>(),
                                       historyFilterFromJson(j))) {
        entries.push_back(auditEntryToJson(e));
      }
      response["entries"] = std::move(entries);
    } else if (cmd == "counts") {
      TicketCounts c = counts(j.at("hub_id").get<std::string>());
      response["counts"] = {{"received", c.received},
                            {"accepted", c.accepted},
                            {"in_progress", c.in_progress},
                            {"ready", c.ready},
                            {"total_active", c.total_active}};
    } else if (cmd == "settings") {
      response["settings"] =
          settingsToJson(settings(j.at("hub_id").get<std::string>()));
    } else if (cmd == "transition") {
      domain::Ticket t =
          transition(j.at("ticket_id").get<domain::TicketId>(),
                     parseTrigger(j.at("trigger").get<std::string>()),
                     j.at("actor").get<std::string>());
      response["ticket"] = ticketToJson(t);
    } else if (cmd == "advance") {
      domain::Ticket t = advance(j.at("ticket_id").get<domain::TicketId>(),
                                 j.at("actor").get<std::string>());
      response["ticket"] = ticketToJson(t);
    } else if (cmd == "change_priority") {
      domain::Ticket t =
          changePriority(j.at("ticket_id").get<domain::TicketId>(),
                         j.at("priority").get<int>(),
                         j.at("actor").get<std::string>());
      response["ticket"] = ticketToJson(t);
    } else {
      return errorReply("unknown_command", "Unknown command: " + cmd).dump();
    }
  } catch (const KitchenError& e) {
    return errorReply(e.kind(), e.what()).dump();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[KitchenEngine] malformed command: " << e.what() << "\n";
    return errorReply("bad_request", e.what()).dump();
  } catch (const std::invalid_argument& e) {
    return errorReply("bad_request", e.what()).dump();
  }

  response["status"] = "ok";
  return response.dump();
}

}  // namespace kds
