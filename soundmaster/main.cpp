#include "audiokit/drivers/pt2258.h"
#include "audiokit/drivers/ssd1306.h"
#include "audiokit/hal/gpio.h"
#include "audiokit/hal/gpio_event_monitor.h"
#include "audiokit/hal/i2c_bus.h"
#include "audiokit/hal/stdio_logger.h"
#include "audiokit/hal/time_source.h"
#include "audiokit/ui/input_selector.h"

#include "soundmaster/audio_controller.h"
#include "soundmaster/audio_status_monitor.h"
#include "soundmaster/config.h"
#include "soundmaster/console_control_source.h"
#include "soundmaster/control_loop.h"
#include "soundmaster/control_queue.h"
#include "soundmaster/display_queue.h"
#include "soundmaster/event_dispatcher.h"
#include "soundmaster/input_switch_worker.h"
#include "soundmaster/save_scheduler.h"
#include "soundmaster/settings_persister.h"
#include "soundmaster/status_display.h"
#include "soundmaster/status_publisher.h"
#include "soundmaster/system_context.h"

#include "etl/array.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <optional>

#include <unistd.h>

using namespace soundmaster;

namespace {

std::atomic<bool> stop_requested{false};

void on_stop_signal(int) {
  stop_requested.store(true);
}

void install_signal_handlers() {
  struct sigaction action = {};
  action.sa_handler = on_stop_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

struct Options {
  bool verbose = false;
  const char *state_path = config::persistence::STATE_FILE;
};

void print_usage(const char *program) {
  std::fprintf(stderr, "Usage: %s [-v|--verbose] [-s|--state <path>]\n", program);
}

std::optional<Options> parse_options(int argc, char **argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];
    if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
      options.verbose = true;
    } else if ((std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--state") == 0) &&
               i + 1 < argc) {
      options.state_path = argv[++i];
    } else {
      return std::nullopt;
    }
  }
  if (!SettingsPersister::is_valid_filepath(options.state_path)) {
    std::fprintf(stderr, "State file path must be 1 to %zu characters long\n",
                 SettingsPersister::MAX_FILEPATH_LENGTH);
    return std::nullopt;
  }
  return options;
}

/**
 * @brief Stamps the levels reported for one GPIO group and queues them for
 * the control thread.
 */
struct PinSampleForwarder {
  PinGroup group;
  ControlQueue &queue;
  audiokit::hal::TimeSource &time_source;

  void on_levels(uint32_t levels) {
    queue.push_sample(RawPinSample{group, levels, time_source.get_time_ms()});
  }

  audiokit::hal::GpioEventMonitor::Callback callback() {
    return audiokit::hal::GpioEventMonitor::Callback::create<PinSampleForwarder,
                                                             &PinSampleForwarder::on_levels>(
        *this);
  }
};

constexpr etl::array<uint32_t, 2> ROTATION_LINES = {config::gpio::ENCODER_LEFT,
                                                    config::gpio::ENCODER_RIGHT};
constexpr etl::array<uint32_t, 1> KEY_LINES = {config::gpio::ENCODER_KEY};
constexpr etl::array<uint32_t, 1> SWITCH_LINES = {config::gpio::INPUT_SWITCH};

} // namespace

// Shared plumbing
static audiokit::StdioLogger logger(audiokit::LogLevel::INFO);
static audiokit::hal::SteadyTimeSource time_source;
static ControlQueue control_queue(logger);
static EventDispatcher dispatcher(logger);
static SystemContext system_context(dispatcher, control_queue, time_source, logger);

int main(int argc, char **argv) {
  const std::optional<Options> options = parse_options(argc, argv);
  if (!options.has_value()) {
    print_usage(argv[0]);
    return 2;
  }
  if (options->verbose) {
    logger.set_level(audiokit::LogLevel::DEBUG);
  }
  install_signal_handlers();
  logger.info("Starting", etl::string_view(config::APP_NAME));

  // --- GPIO ---
  audiokit::hal::GpioLinesConfig rotation_config;
  rotation_config.edge_events = true;
  rotation_config.debounce_us = config::gpio::ENCODER_DEBOUNCE_US;
  audiokit::hal::GpioLines rotation_lines(config::gpio::CHIP_PATH, ROTATION_LINES,
                                          rotation_config, config::gpio::CONSUMER, logger);

  audiokit::hal::GpioLinesConfig key_config;
  key_config.edge_events = true;
  key_config.debounce_us = config::gpio::KEY_DEBOUNCE_US;
  audiokit::hal::GpioLines key_line(config::gpio::CHIP_PATH, KEY_LINES, key_config,
                                    config::gpio::CONSUMER, logger);

  audiokit::hal::GpioLinesConfig indicator_config;
  indicator_config.bias = audiokit::hal::GpioBias::PULL_DOWN;
  indicator_config.edge_events = true;
  audiokit::hal::GpioLines indicator_lines(config::gpio::CHIP_PATH,
                                           config::gpio::INPUT_INDICATORS, indicator_config,
                                           config::gpio::CONSUMER, logger);

  audiokit::hal::GpioLinesConfig switch_config;
  switch_config.direction = audiokit::hal::GpioDirection::OUT;
  audiokit::hal::GpioLines switch_line(config::gpio::CHIP_PATH, SWITCH_LINES, switch_config,
                                       config::gpio::CONSUMER, logger);

  if (!rotation_lines.is_open() || !key_line.is_open() || !indicator_lines.is_open() ||
      !switch_line.is_open()) {
    logger.error("GPIO setup failed, exiting");
    return 1;
  }

  // --- I2C peripherals ---
  audiokit::hal::LinuxI2cBus i2c_bus(config::i2c::BUS_PATH, logger);
  if (!i2c_bus.is_open()) {
    logger.error("I2C bus unavailable, continuing without attenuator and display");
  }

  std::optional<audiokit::drivers::Pt2258> attenuator;
  try {
    attenuator.emplace(i2c_bus, config::i2c::PT2258_ADDRESS, time_source, logger);
  } catch (const audiokit::drivers::Pt2258Error &e) {
    logger.error("PT2258 initialisation failed", etl::string_view(e.what()));
  }

  audiokit::drivers::Ssd1306 oled(i2c_bus, config::i2c::DISPLAY_ADDRESS, logger);
  if (oled.init() != audiokit::drivers::Ssd1306Status::OK) {
    logger.warn("Display initialisation failed, continuing without display");
  } else if (oled.set_contrast(config::display::CONTRAST) !=
             audiokit::drivers::Ssd1306Status::OK) {
    logger.warn("Failed to set display contrast");
  }

  // --- Components ---
  DisplayQueue display_queue(oled, logger);
  StatusDisplay status_display(display_queue);
  LoggingStatusPublisher status_publisher(logger);
  SettingsPersister persister;
  SaveScheduler save_scheduler(options->state_path, persister, control_queue, logger);

  audiokit::ui::InputSelector input_selector(logger);
  InputSwitchWorker input_switch(input_selector, switch_line, time_source, logger);

  AudioController controller(system_context, attenuator.has_value() ? &*attenuator : nullptr,
                             status_publisher, status_display, save_scheduler, input_switch);
  if (!controller.subscribe()) {
    logger.error("Controller subscription failed, exiting");
    return 1;
  }

  ControlLoop control_loop(system_context, input_selector);

  // Starting levels: the selector is seeded silently, the encoder sees the
  // rest position as an ordinary sample.
  const std::optional<uint32_t> indicator_levels = indicator_lines.read();
  input_selector.init(indicator_levels.value_or(0));
  const std::optional<uint32_t> rotation_levels = rotation_lines.read();
  if (rotation_levels.has_value()) {
    control_queue.push_sample(
        RawPinSample{PinGroup::ENCODER_ROTATION, *rotation_levels, time_source.get_time_ms()});
  }

  PinSampleForwarder rotation_forwarder{PinGroup::ENCODER_ROTATION, control_queue, time_source};
  PinSampleForwarder key_forwarder{PinGroup::ENCODER_KEY, control_queue, time_source};
  PinSampleForwarder indicator_forwarder{PinGroup::INPUT_INDICATORS, control_queue, time_source};

  audiokit::hal::GpioEventMonitor gpio_monitor(logger);
  if (!gpio_monitor.watch(rotation_lines, rotation_forwarder.callback()) ||
      !gpio_monitor.watch(key_line, key_forwarder.callback()) ||
      !gpio_monitor.watch(indicator_lines, indicator_forwarder.callback())) {
    logger.error("GPIO monitor setup failed, exiting");
    return 1;
  }

  AudioStatusMonitor audio_status_monitor(config::audio_status::STATUS_FILE, control_queue,
                                          logger);
  ConsoleControlSource console(STDIN_FILENO, control_queue, logger);

  // --- Start ---
  display_queue.start();
  input_switch.start();
  if (!gpio_monitor.start()) {
    logger.error("GPIO monitor failed to start, exiting");
    input_switch.stop();
    display_queue.stop();
    return 1;
  }
  audio_status_monitor.start();
  console.start();

  if (attenuator.has_value()) {
    control_queue.push_event(Event(Events::AttenuatorReadyEvent{}));
  }
  control_queue.push_event(
      Event(Events::StateLoadedEvent{persister.load_or_defaults(options->state_path, logger)}));

  control_loop.run(stop_requested);

  // --- Shutdown ---
  logger.info("Shutting down");
  input_switch.stop();
  console.stop();
  gpio_monitor.stop();
  audio_status_monitor.stop();
  control_queue.close();
  if (!save_scheduler.flush()) {
    logger.error("Final state save failed");
  }
  display_queue.stop();

  return 0;
}
