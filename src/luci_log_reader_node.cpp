#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/empty.hpp"
#include "std_msgs/msg/string.hpp"

#include "luci_servo_cpp/serial_log_reader.hpp"
#include "luci_servo_cpp/servo_constants.hpp"

using namespace std;
using namespace luci_servo_cpp;


/// 게이트웨이 콘솔 로그를 ~/lines 로 내보내고 ~/command 텍스트를 콘솔로 전달
class LuciLogReaderNode : public rclcpp::Node
{
public:
  LuciLogReaderNode()
  : Node("luci_log_reader")
  {
    declare_parameter<string>("device", "/dev/ttyUSB1");
    declare_parameter<int>("baudrate", kDefaultSerialBaudRate);
    declare_parameter<int>("poll_interval_ms", 100);
    declare_parameter<double>("reconnect_interval_sec", 2.0);

    const auto device = get_parameter("device").as_string();
    const auto baudrate = static_cast<int>(get_parameter("baudrate").as_int());
    auto poll_ms = static_cast<int>(get_parameter("poll_interval_ms").as_int());
    if (poll_ms <= 0) {
      RCLCPP_WARN(get_logger(), "poll_interval_ms must be positive, fallback to 100");
      poll_ms = 100;
    }
    auto reconnect_sec = get_parameter("reconnect_interval_sec").as_double();
    if (reconnect_sec <= 0.0) {
      reconnect_sec = 2.0;
    }

    lines_pub_ = create_publisher<std_msgs::msg::String>("~/lines", 50);

    reader_ = make_unique<SerialLogReader>(device, baudrate, poll_ms);
    reader_->set_callback(
      [this](const string & line) {
        std_msgs::msg::String msg;
        msg.data = line;
        lines_pub_->publish(msg);
      });

    command_sub_ = create_subscription<std_msgs::msg::String>(
      "~/command", 10, bind(&LuciLogReaderNode::on_command, this, placeholders::_1));
    interrupt_sub_ = create_subscription<std_msgs::msg::Empty>(
      "~/interrupt", 1, bind(&LuciLogReaderNode::on_interrupt, this, placeholders::_1));

    if (!reader_->start()) {
      RCLCPP_WARN(get_logger(), "open %s failed, retrying", device.c_str());
    }

    // 포트가 빠졌다 다시 꽂히는 경우 재시작
    reconnect_timer_ = create_wall_timer(
      chrono::duration<double>(reconnect_sec),
      [this]() {
        if (!reader_->is_running() && reader_->start()) {
          RCLCPP_INFO(get_logger(), "log reader reconnected");
        }
      });

    RCLCPP_INFO(get_logger(), "start (%s @ %d)", device.c_str(), baudrate);
  }

  ~LuciLogReaderNode() override
  {
    if (reader_) {
      reader_->stop();
    }
  }

private:
  void on_command(const std_msgs::msg::String::SharedPtr msg)
  {
    if (!reader_->send_line(msg->data)) {
      RCLCPP_WARN(get_logger(), "command not sent: %s", reader_->last_error().c_str());
    }
  }

  void on_interrupt(const std_msgs::msg::Empty::SharedPtr /*msg*/)
  {
    if (!reader_->send_interrupt()) {
      RCLCPP_WARN(get_logger(), "interrupt not sent: %s", reader_->last_error().c_str());
    }
  }

  unique_ptr<SerialLogReader> reader_;

  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr lines_pub_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr command_sub_;
  rclcpp::Subscription<std_msgs::msg::Empty>::SharedPtr interrupt_sub_;
  rclcpp::TimerBase::SharedPtr reconnect_timer_;
};

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  try {
    auto node = make_shared<LuciLogReaderNode>();
    rclcpp::spin(node);
  } catch (const exception & e) {
    fprintf(stderr, "Failed to start node: %s\n", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::shutdown();
  return 0;
}
