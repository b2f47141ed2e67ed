/*
  motorlab_host

  Laptop tool for the MotorLab board: starts one step response with the
  given gain and controller period, waits for motor 1's data set and writes
  it as "time_ms,position" CSV (stdout unless --out is given).

  Examples:
    motorlab_host --kp 0.06 --period 30 --out step_30ms.csv
    motorlab_host --status
*/

#include <getopt.h>
#include <stdio.h>
#include <time.h>

#include <vector>

#include "HostOptions.h"
#include "Params.h"
#include "PosixSerialPort.h"
#include "StepClient.h"
#include "utils/Log.h"

static const char* DEFAULT_PORT = "/dev/ttyACM0";
static const uint32_t DEFAULT_TIMEOUT_MS = 10000;
static const uint32_t STATUS_LINGER_MS = 500;
static const uint8_t REPORTED_MOTOR = 1;

static void stderrSink(LogLevel level, const char* msg, void* ctx) {
  (void)ctx;
  fprintf(stderr, "[%s] %s\n", logLevelName(level), msg);
}

static uint32_t hostMillis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint32_t)((uint64_t)ts.tv_sec * 1000u + (uint64_t)ts.tv_nsec / 1000000u);
}

static void hostIdle() {
  struct timespec ts;
  ts.tv_sec = 0;
  ts.tv_nsec = 1000000;  // 1 ms
  nanosleep(&ts, nullptr);
}

static void usage(const char* argv0) {
  fprintf(stderr,
          "usage: %s [options]\n"
          "  --port PATH     serial device (default %s)\n"
          "  --baud N        baud rate (default %lu)\n"
          "  --kp F          proportional gain (default %.2f)\n"
          "  --period MS     controller period in ms (default %lu)\n"
          "  --out FILE      write CSV here instead of stdout\n"
          "  --timeout MS    give up after this long without board traffic,\n"
          "                  on top of the run time (default %lu)\n"
          "  --stop          abort a running step and exit\n"
          "  --status        print the board's task and share report\n"
          "  --verbose       debug logging\n",
          argv0,
          DEFAULT_PORT,
          (unsigned long)SERIAL_BAUD,
          (double)DEFAULT_KP,
          (unsigned long)DEFAULT_PERIOD_MS,
          (unsigned long)DEFAULT_TIMEOUT_MS);
}

static bool writeCsv(const char* path, const std::vector<Sample>& samples) {
  FILE* f = stdout;
  if (path) {
    f = fopen(path, "w");
    if (!f) {
      LOG_ERROR("cannot open %s for writing", path);
      return false;
    }
  }

  fprintf(f, "time_ms,position\n");
  for (size_t i = 0; i < samples.size(); i++) {
    fprintf(f, "%lu,%ld\n",
            (unsigned long)samples[i].t_ms,
            (long)samples[i].position);
  }

  bool ok = !ferror(f);
  if (path) ok = (fclose(f) == 0) && ok;
  if (!ok) LOG_ERROR("write failed for %s", path ? path : "stdout");
  return ok;
}

int main(int argc, char** argv) {
  logSetSink(&stderrSink, nullptr);
  logSetLevel(LogLevel::INFO);

  const char* port_path = DEFAULT_PORT;
  const char* out_path = nullptr;
  const char* kp_text = nullptr;
  const char* period_text = nullptr;
  uint32_t baud = SERIAL_BAUD;
  uint32_t timeout_ms = DEFAULT_TIMEOUT_MS;
  bool do_stop = false;
  bool do_status = false;

  enum { OPT_STOP = 1000, OPT_STATUS };

  static const struct option long_opts[] = {
    { "port",    required_argument, nullptr, 'p' },
    { "baud",    required_argument, nullptr, 'b' },
    { "kp",      required_argument, nullptr, 'k' },
    { "period",  required_argument, nullptr, 't' },
    { "out",     required_argument, nullptr, 'o' },
    { "timeout", required_argument, nullptr, 'w' },
    { "stop",    no_argument,       nullptr, OPT_STOP },
    { "status",  no_argument,       nullptr, OPT_STATUS },
    { "verbose", no_argument,       nullptr, 'v' },
    { "help",    no_argument,       nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
  };

  int opt;
  while ((opt = getopt_long(argc, argv, "p:b:k:t:o:w:vh", long_opts, nullptr)) != -1) {
    switch (opt) {
      case 'p': port_path = optarg; break;
      case 'k': kp_text = optarg; break;
      case 't': period_text = optarg; break;
      case 'o': out_path = optarg; break;
      case 'v': logSetLevel(LogLevel::DBG); break;
      case OPT_STOP: do_stop = true; break;
      case OPT_STATUS: do_status = true; break;

      case 'b':
        if (!parseUnsigned(optarg, baud)) {
          LOG_ERROR("bad baud rate '%s'", optarg);
          return 2;
        }
        break;

      case 'w':
        if (!parseUnsigned(optarg, timeout_ms)) {
          LOG_ERROR("bad timeout '%s'", optarg);
          return 2;
        }
        break;

      case 'h':
        usage(argv[0]);
        return 0;

      default:
        usage(argv[0]);
        return 2;
    }
  }

  PosixSerialPort port;
  if (!port.open(port_path, baud)) return 1;
  port.flushInput();

  StepClient client(port, &hostMillis, &hostIdle);

  if (do_stop) {
    if (!client.stop(timeout_ms)) {
      LOG_ERROR("stop failed: %s", client.lastError());
      return 1;
    }
    LOG_INFO("stopped");
    return 0;
  }

  if (do_status) {
    if (!client.status(timeout_ms, STATUS_LINGER_MS)) {
      LOG_ERROR("status failed: %s", client.lastError());
      return 1;
    }
    return 0;
  }

  float kp = DEFAULT_KP;
  uint32_t period_ms = DEFAULT_PERIOD_MS;
  parseKpOrDefault(kp_text, kp);
  parsePeriodOrDefault(period_text, period_ms);

  std::vector<Sample> samples;
  samples.reserve(STEP_SAMPLES);

  if (!client.runStep(kp, period_ms, REPORTED_MOTOR, timeout_ms, samples)) {
    LOG_ERROR("step run failed: %s", client.lastError());
    return 1;
  }

  if (client.discardedLines() > 0) {
    LOG_INFO("discarded %lu non-protocol lines",
             (unsigned long)client.discardedLines());
  }

  return writeCsv(out_path, samples) ? 0 : 1;
}
