#include "attack_simulator.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <thread>

namespace {

const std::vector<nlohmann::json> SQLI_PAYLOADS = {
    {{"username", "admin' OR '1'='1--"}, {"password", "pw"}},
    {{"query", "'; SELECT pg_sleep(2); --"}},
    {{"id", "1 UNION SELECT null, version(), null--"}}};

const std::vector<nlohmann::json> XSS_PAYLOADS = {
    {{"comment", "<script>alert('xss')</script>"}},
    {{"name", "\"><img src=x onerror=alert(document.cookie)>"}},
    {{"redirect", "javascript:alert(1)"}}};

const std::vector<nlohmann::json> PAYMENT_PAYLOADS = {
    {{"card_number", "4111111111111111"},
     {"cvv", "000"},
     {"expiry_date", "01/20"},
     {"amount", 99999.99},
     {"currency", "USD"}},
    {{"payment_token", "tok_simulated_0001"},
     {"amount", 0.01},
     {"currency", "USD"}}};

const std::vector<nlohmann::json> CARD_TESTING_PAYLOADS = {
    {{"card_bin", "411111"},
     {"payment_token", "tok_sim_1"},
     {"reason", "card_declined"}},
    {{"card_bin", "411111"},
     {"payment_token", "tok_sim_2"},
     {"reason", "insufficient_funds"}},
    {{"card_bin", "550000"},
     {"payment_token", "tok_sim_3"},
     {"reason", "incorrect_cvc"}},
    {{"card_bin", "550000"},
     {"payment_token", "tok_sim_4"},
     {"reason", "expired_card"}},
    {{"card_bin", "378282"},
     {"payment_token", "tok_sim_5"},
     {"reason", "card_declined"}}};

const std::vector<std::string> BRUTE_FORCE_PASSWORDS = {
    "123456", "password", "qwerty", "letmein", "admin", "welcome"};

constexpr const char *BRUTE_FORCE_USER = "simulated_victim";

} // namespace

AttackSimulator::AttackSimulator(IncidentService &incidents,
                                 Broadcaster &broadcaster)
    : AttackSimulator(incidents, broadcaster, Options{}) {}

AttackSimulator::AttackSimulator(IncidentService &incidents,
                                 Broadcaster &broadcaster, Options options)
    : incidents_(incidents), broadcaster_(broadcaster),
      options_(std::move(options)), gen_(std::random_device{}()) {}

AttackSimulator::~AttackSimulator() { stop(); }

std::string AttackSimulator::random_source_ip() {
  std::uniform_int_distribution<> dis(50, 150);
  return "192.168.1." + std::to_string(dis(gen_));
}

Event AttackSimulator::make_event(const std::string &event_type,
                                  const std::string &ip,
                                  nlohmann::json payload) {
  std::uniform_int_distribution<> minor(0, 9);
  Event event;
  event.event_type = event_type;
  event.source_ip = ip;
  event.payload = std::move(payload);
  event.user_agent = "EthicalSim/1." + std::to_string(minor(gen_));
  return event;
}

std::vector<std::vector<Event>> AttackSimulator::build_batches() {
  std::vector<std::vector<Event>> batches;

  auto template_batch = [this](const std::string &event_type,
                               const std::vector<nlohmann::json> &payloads) {
    std::uniform_int_distribution<size_t> pick(0, payloads.size() - 1);
    std::vector<Event> batch;
    const std::string ip = random_source_ip();
    for (size_t i = 0; i < options_.events_per_template; ++i)
      batch.push_back(make_event(event_type, ip, payloads[pick(gen_)]));
    return batch;
  };

  batches.push_back(template_batch("simulated_sql_injection", SQLI_PAYLOADS));
  batches.push_back(template_batch("simulated_xss", XSS_PAYLOADS));
  batches.push_back(
      template_batch("simulated_payment_anomaly", PAYMENT_PAYLOADS));

  std::vector<Event> brute_force;
  const std::string brute_ip = random_source_ip();
  for (size_t i = 0; i < options_.brute_force_attempts; ++i) {
    Event event = make_event(
        "login_failure", brute_ip,
        {{"password",
          BRUTE_FORCE_PASSWORDS[i % BRUTE_FORCE_PASSWORDS.size()]}});
    event.user_id = BRUTE_FORCE_USER;
    brute_force.push_back(std::move(event));
  }
  batches.push_back(std::move(brute_force));

  std::vector<Event> card_testing;
  const std::string card_ip = random_source_ip();
  for (const auto &payload : CARD_TESTING_PAYLOADS)
    card_testing.push_back(make_event("payment_failure", card_ip, payload));
  batches.push_back(std::move(card_testing));

  // The flood batch is generated lazily in run_all, paced by time.
  return batches;
}

bool AttackSimulator::pause(CancellableTask *task,
                            std::chrono::milliseconds duration) {
  if (task)
    return task->wait_for(duration);
  std::this_thread::sleep_for(duration);
  return true;
}

void AttackSimulator::run_all(CancellableTask *task) {
  std::uniform_int_distribution<long long> pause_ms(options_.min_pause.count(),
                                                    options_.max_pause.count());
  size_t submitted = 0;

  for (const auto &batch : build_batches()) {
    for (const auto &event : batch) {
      auto result = incidents_.submit_event(event);
      ++submitted;
      LOG(LogLevel::DEBUG, LogComponent::SIMULATION,
          "Simulated " << event.event_type << " from " << event.source_ip
                       << ": " << outcome_to_string(result.outcome));
      if (!pause(task, std::chrono::milliseconds(pause_ms(gen_))))
        return;
    }
  }

  const std::string flood_ip = random_source_ip();
  const auto flood_end =
      std::chrono::steady_clock::now() + options_.flood_duration;
  uint64_t req_id = 0;
  while (std::chrono::steady_clock::now() < flood_end) {
    incidents_.submit_event(make_event(
        "simulated_high_traffic", flood_ip,
        {{"req_id", ++req_id}, {"ts", Utils::get_current_time_ms()}}));
    ++submitted;
    if (!pause(task, options_.flood_spacing))
      return;
  }

  LOG(LogLevel::INFO, LogComponent::SIMULATION,
      "Simulation submitted " << submitted << " events.");
}

void AttackSimulator::broadcast_status(const std::string &status,
                                       const std::string &message) {
  broadcaster_.broadcast(JsonFormatter::make_envelope(
      "simulation_status", {{"status", status}, {"message", message}}));
}

bool AttackSimulator::trigger() {
  std::lock_guard<std::mutex> lock(task_mutex_);
  if (task_ && !task_->is_finished())
    return false;

  // A finished task is joined before it is replaced.
  task_ = std::make_unique<CancellableTask>("attack-simulation");
  task_->start([this](CancellableTask &task) {
    broadcast_status("running", "Attack simulation initiated...");
    try {
      run_all(&task);
      if (task.is_cancelled()) {
        broadcast_status("failed", "Simulation cancelled.");
        return;
      }
      broadcast_status("completed", "Simulation finished successfully.");
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::SIMULATION,
          "Simulation failed: " << e.what());
      broadcast_status("failed", std::string("Simulation failed: ") + e.what());
    }
  });
  LOG(LogLevel::INFO, LogComponent::SIMULATION, "Attack simulation started.");
  return true;
}

bool AttackSimulator::is_running() const {
  std::lock_guard<std::mutex> lock(task_mutex_);
  return task_ && !task_->is_finished();
}

void AttackSimulator::stop() {
  std::unique_ptr<CancellableTask> task;
  {
    std::lock_guard<std::mutex> lock(task_mutex_);
    task = std::move(task_);
  }
  if (task) {
    task->cancel();
    task->join();
  }
}
