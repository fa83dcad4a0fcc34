#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/float64_multi_array.hpp"
#include "std_msgs/msg/int64_multi_array.hpp"
#include "std_srvs/srv/trigger.hpp"

#include "luci_servo_cpp/luci_packet.hpp"
#include "luci_servo_cpp/servo_constants.hpp"
#include "luci_servo_cpp/servo_controller.hpp"
#include "luci_servo_cpp/transport.hpp"

using namespace std;
using namespace luci_servo_cpp;


class LuciServoNode : public rclcpp::Node
{
public:
  LuciServoNode()
  : Node("luci_servo")
  {
    declare_parameter<string>("transport", "serial");
    declare_parameter<string>("device", "/dev/ttyUSB0");
    declare_parameter<int>("serial_baudrate", kDefaultSerialBaudRate);
    declare_parameter<string>("host", "192.168.1.100");
    declare_parameter<int>("port", luci::kDefaultTcpPort);
    declare_parameter<double>("connect_timeout_sec", kConnectTimeoutMs / 1000.0);
    declare_parameter<double>("reply_timeout_sec", kReplyTimeoutMs / 1000.0);
    declare_parameter<int>("inter_command_delay_ms", kInterCommandDelayMs);
    declare_parameter<double>("serial_settle_sec", kSerialSettleMs / 1000.0);
    declare_parameter<string>("preamble_encoding", "text");
    declare_parameter<bool>("log_replies", false);

    declare_parameter<string>("envelope_layout", "uart_bridge");
    declare_parameter<int>("module_number", luci::kRobotControllerModule);
    declare_parameter<int>("bus_baudrate", static_cast<int>(luci::kDefaultBusBaudRate));

    declare_parameter<vector<int64_t>>("motor_ids", {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12});
    declare_parameter<vector<string>>("motor_models", vector<string>(kDefaultServoCount, "AX12"));
    declare_parameter<double>("default_velocity_rpm", kDefaultVelocityRpm);
    declare_parameter<vector<double>>(
      "neutral_pose", vector<double>(kNeutralPose.begin(), kNeutralPose.end()));
    declare_parameter<bool>("debug_frames", false);
    declare_parameter<bool>("connect_on_start", true);
    declare_parameter<bool>("move_to_neutral_on_start", false);

    declare_parameter<double>("sweep_start_deg", 90.0);
    declare_parameter<double>("sweep_end_deg", 210.0);
    declare_parameter<double>("sweep_step_deg", 10.0);
    declare_parameter<int>("sweep_hold_ms", 100);

    const auto transport_config = load_transport_config();
    const auto controller_config = load_controller_config();

    sweep_start_ = get_parameter("sweep_start_deg").as_double();
    sweep_end_ = get_parameter("sweep_end_deg").as_double();
    sweep_step_ = get_parameter("sweep_step_deg").as_double();
    sweep_hold_ms_ = static_cast<int>(get_parameter("sweep_hold_ms").as_int());

    controller_ = make_unique<ServoController>(make_transport(transport_config), controller_config);

    RCLCPP_INFO(
      get_logger(), "transport=%s layout=%s module=%d bus_baud=%u motors=%zu",
      transport_config.kind.c_str(), envelope_layout_name(controller_config.envelope.layout),
      static_cast<int>(controller_config.envelope.module_number), controller_config.envelope.bus_baudrate,
      controller_config.motor_ids.size());

    set_positions_sub_ = create_subscription<std_msgs::msg::Float64MultiArray>(
      "~/set_positions", 10, bind(&LuciServoNode::on_set_positions, this, placeholders::_1));
    set_servo_baud_sub_ = create_subscription<std_msgs::msg::Int64MultiArray>(
      "~/set_servo_baud", 1, bind(&LuciServoNode::on_set_servo_baud, this, placeholders::_1));

    connect_srv_ = create_service<std_srvs::srv::Trigger>(
      "~/connect", bind(&LuciServoNode::on_connect, this, placeholders::_1, placeholders::_2));
    disconnect_srv_ = create_service<std_srvs::srv::Trigger>(
      "~/disconnect", bind(&LuciServoNode::on_disconnect, this, placeholders::_1, placeholders::_2));
    neutral_srv_ = create_service<std_srvs::srv::Trigger>(
      "~/move_to_neutral",
      bind(&LuciServoNode::on_move_to_neutral, this, placeholders::_1, placeholders::_2));
    sweep_srv_ = create_service<std_srvs::srv::Trigger>(
      "~/sweep", bind(&LuciServoNode::on_sweep, this, placeholders::_1, placeholders::_2));
    stop_srv_ = create_service<std_srvs::srv::Trigger>(
      "~/stop", bind(&LuciServoNode::on_stop, this, placeholders::_1, placeholders::_2));

    if (get_parameter("connect_on_start").as_bool()) {
      lock_guard<mutex> lk(command_mutex_);
      const auto result = controller_->connect();
      if (!result.ok) {
        RCLCPP_WARN(
          get_logger(), "initial connect failed (%s): %s",
          error_code_name(result.code), result.error.c_str());
      } else if (get_parameter("move_to_neutral_on_start").as_bool()) {
        log_result("move_to_neutral", controller_->move_to_neutral());
      }
    }

    RCLCPP_INFO(get_logger(), "start");
  }

  ~LuciServoNode() override
  {
    stop_sequence();
    if (controller_) {
      lock_guard<mutex> lk(command_mutex_);
      controller_->disconnect();
    }
  }

private:
  /// 전송 계층 파라미터 로드 (잘못된 값은 기본값으로 대체)
  TransportConfig load_transport_config()
  {
    TransportConfig config;
    const auto kind = get_parameter("transport").as_string();
    if (!parse_transport_kind(kind, config.kind)) {
      RCLCPP_WARN(get_logger(), "unknown transport '%s', fallback to serial", kind.c_str());
      config.kind = "serial";
    }
    config.device = get_parameter("device").as_string();
    config.serial_baudrate = static_cast<int>(get_parameter("serial_baudrate").as_int());
    config.host = get_parameter("host").as_string();

    const auto port = get_parameter("port").as_int();
    if (port <= 0 || port > 65535) {
      RCLCPP_WARN(get_logger(), "invalid port %ld, fallback to %d", static_cast<long>(port), static_cast<int>(luci::kDefaultTcpPort));
    } else {
      config.port = static_cast<int>(port);
    }

    config.connect_timeout_ms = seconds_to_ms("connect_timeout_sec", kConnectTimeoutMs);
    config.reply_timeout_ms = seconds_to_ms("reply_timeout_sec", kReplyTimeoutMs);
    config.serial_settle_ms = seconds_to_ms("serial_settle_sec", kSerialSettleMs);

    const auto delay = get_parameter("inter_command_delay_ms").as_int();
    config.inter_command_delay_ms = delay >= 0 ? static_cast<int>(delay) : kInterCommandDelayMs;

    const auto encoding = get_parameter("preamble_encoding").as_string();
    if (!parse_preamble_encoding(encoding, config.preamble_encoding)) {
      RCLCPP_WARN(get_logger(), "unknown preamble_encoding '%s', fallback to text", encoding.c_str());
    }
    config.log_replies = get_parameter("log_replies").as_bool();
    return config;
  }

  /// 봉투/서보 세트 파라미터 로드
  ControllerConfig load_controller_config()
  {
    ControllerConfig config;

    const auto layout = get_parameter("envelope_layout").as_string();
    if (!parse_envelope_layout(layout, config.envelope.layout)) {
      RCLCPP_WARN(get_logger(), "unknown envelope_layout '%s', fallback to uart_bridge", layout.c_str());
    }

    const auto module = get_parameter("module_number").as_int();
    if (module < 0 || module > 0xFFFF) {
      RCLCPP_WARN(get_logger(), "invalid module_number %ld, fallback to %d", static_cast<long>(module), static_cast<int>(luci::kRobotControllerModule));
    } else {
      config.envelope.module_number = static_cast<uint16_t>(module);
    }

    const auto bus_baud = get_parameter("bus_baudrate").as_int();
    if (bus_baud > 0) {
      config.envelope.bus_baudrate = static_cast<uint32_t>(bus_baud);
    }
    if (!is_supported_baud_rate(config.envelope.bus_baudrate)) {
      RCLCPP_WARN(
        get_logger(), "bus_baudrate %u not in gateway table, gateway index %u will be used",
        config.envelope.bus_baudrate, baud_rate_index(config.envelope.bus_baudrate));
    }

    const auto ids = get_parameter("motor_ids").as_integer_array();
    const auto models = get_parameter("motor_models").as_string_array();
    vector<uint8_t> motor_ids;
    vector<MotorModel> motor_models;
    bool valid = !ids.empty() && ids.size() == models.size();
    for (size_t i = 0; valid && i < ids.size(); ++i) {
      MotorModel model = MotorModel::AX12;
      if (ids[i] < dxl::kMinMotorId || ids[i] > dxl::kMaxMotorId ||
        !parse_motor_model(models[i], model))
      {
        valid = false;
        break;
      }
      motor_ids.push_back(static_cast<uint8_t>(ids[i]));
      motor_models.push_back(model);
    }
    if (valid) {
      config.motor_ids = motor_ids;
      config.motor_models = motor_models;
    } else {
      RCLCPP_WARN(get_logger(), "invalid motor_ids/motor_models, fallback to ids 1..12 AX12");
    }

    const auto velocity = get_parameter("default_velocity_rpm").as_double();
    if (velocity > 0.0) {
      config.default_velocity_rpm = velocity;
    }

    const auto neutral = get_parameter("neutral_pose").as_double_array();
    if (neutral.size() == config.motor_ids.size()) {
      config.neutral_pose = neutral;
    } else {
      RCLCPP_WARN(
        get_logger(), "neutral_pose has %zu entries for %zu motors, using built-in pose",
        neutral.size(), config.motor_ids.size());
      config.neutral_pose.assign(kNeutralPose.begin(), kNeutralPose.end());
      config.neutral_pose.resize(config.motor_ids.size(), 150.0);
    }

    config.debug_frames = get_parameter("debug_frames").as_bool();
    return config;
  }

  int seconds_to_ms(const string & name, int fallback_ms)
  {
    const auto sec = get_parameter(name).as_double();
    if (sec < 0.0) {
      RCLCPP_WARN(get_logger(), "%s must not be negative, fallback to %d ms", name.c_str(), fallback_ms);
      return fallback_ms;
    }
    return static_cast<int>(sec * 1000.0);
  }

  void log_result(const char * what, const CommandResult & result)
  {
    if (result.ok) {
      RCLCPP_INFO(get_logger(), "%s sent", what);
    } else {
      RCLCPP_ERROR(
        get_logger(), "%s failed (%s): %s", what, error_code_name(result.code), result.error.c_str());
    }
  }

  /// 설정된 서보 세트의 목표 각도(deg) 수신
  void on_set_positions(const std_msgs::msg::Float64MultiArray::SharedPtr msg)
  {
    if (sequence_running_) {
      RCLCPP_WARN(get_logger(), "sweep running, set_positions ignored");
      return;
    }
    lock_guard<mutex> lk(command_mutex_);
    log_result("set_positions", controller_->send_all(msg->data));
  }

  /// [servo id, target bps] 로 서보 자체 baud rate 변경
  void on_set_servo_baud(const std_msgs::msg::Int64MultiArray::SharedPtr msg)
  {
    if (msg->data.size() != 2 ||
      ((msg->data[0] < dxl::kMinMotorId || msg->data[0] > dxl::kMaxMotorId) &&
      msg->data[0] != dxl::kBroadcastId))
    {
      RCLCPP_WARN(get_logger(), "set_servo_baud expects [id(1..252 or 254), bps]");
      return;
    }
    lock_guard<mutex> lk(command_mutex_);
    log_result(
      "set_servo_baud",
      controller_->set_servo_baud_rate(
        static_cast<uint8_t>(msg->data[0]), static_cast<double>(msg->data[1]),
        controller_->config().envelope.bus_baudrate));
  }

  void on_connect(
    const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    shared_ptr<std_srvs::srv::Trigger::Response> response)
  {
    lock_guard<mutex> lk(command_mutex_);
    const auto result = controller_->connect();
    response->success = result.ok;
    response->message = result.ok ? "connected" : string(error_code_name(result.code)) + ": " + result.error;
  }

  void on_disconnect(
    const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    shared_ptr<std_srvs::srv::Trigger::Response> response)
  {
    stop_sequence();
    lock_guard<mutex> lk(command_mutex_);
    controller_->disconnect();
    response->success = true;
    response->message = "disconnected";
  }

  void on_move_to_neutral(
    const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    shared_ptr<std_srvs::srv::Trigger::Response> response)
  {
    stop_sequence();
    lock_guard<mutex> lk(command_mutex_);
    const auto result = controller_->move_to_neutral();
    log_result("move_to_neutral", result);
    response->success = result.ok;
    response->message = result.ok ? "neutral" : result.error;
  }

  /// 전체 서보 sweep 을 작업 스레드에서 실행. ~/stop 으로 명령 사이에서 중단된다.
  void on_sweep(
    const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    shared_ptr<std_srvs::srv::Trigger::Response> response)
  {
    if (sequence_running_) {
      response->success = false;
      response->message = "sweep already running";
      return;
    }

    vector<vector<double>> poses;
    try {
      poses = ServoController::make_sweep(
        sweep_start_, sweep_end_, sweep_step_, controller_->config().motor_ids.size());
    } catch (const exception & e) {
      response->success = false;
      response->message = e.what();
      return;
    }

    if (sequence_thread_.joinable()) {
      sequence_thread_.join();
    }
    stop_requested_ = false;
    sequence_running_ = true;
    sequence_thread_ = thread([this, poses]() {
      CommandResult error = CommandResult::success();
      size_t sent = 0;
      {
        lock_guard<mutex> lk(command_mutex_);
        sent = controller_->play_sequence(
          poses, stop_requested_, chrono::milliseconds(sweep_hold_ms_), &error);
        if (error.ok && !stop_requested_) {
          log_result("move_to_neutral", controller_->move_to_neutral());
        }
      }
      if (!error.ok) {
        RCLCPP_ERROR(
          get_logger(), "sweep aborted after %zu poses (%s): %s",
          sent, error_code_name(error.code), error.error.c_str());
      } else {
        RCLCPP_INFO(get_logger(), "sweep finished: %zu/%zu poses", sent, poses.size());
      }
      sequence_running_ = false;
    });

    response->success = true;
    response->message = "sweep started (" + to_string(poses.size()) + " poses)";
  }

  void on_stop(
    const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
    shared_ptr<std_srvs::srv::Trigger::Response> response)
  {
    const bool was_running = sequence_running_;
    stop_sequence();
    response->success = true;
    response->message = was_running ? "stopped" : "idle";
  }

  void stop_sequence()
  {
    stop_requested_ = true;
    if (sequence_thread_.joinable()) {
      sequence_thread_.join();
    }
  }

private:
  unique_ptr<ServoController> controller_;
  // 하나의 연결에 한 명령씩만 보낸다
  mutex command_mutex_;

  double sweep_start_{90.0};
  double sweep_end_{210.0};
  double sweep_step_{10.0};
  int sweep_hold_ms_{100};

  atomic<bool> stop_requested_{false};
  atomic<bool> sequence_running_{false};
  thread sequence_thread_;

  rclcpp::Subscription<std_msgs::msg::Float64MultiArray>::SharedPtr set_positions_sub_;
  rclcpp::Subscription<std_msgs::msg::Int64MultiArray>::SharedPtr set_servo_baud_sub_;

  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr connect_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr disconnect_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr neutral_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr sweep_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr stop_srv_;
};

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  try {
    auto node = make_shared<LuciServoNode>();
    rclcpp::spin(node);
  } catch (const exception & e) {
    fprintf(stderr, "Failed to start node: %s\n", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::shutdown();
  return 0;
}
