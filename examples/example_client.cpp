/**
 * @file example_client.cpp
 * @brief Read or write holding registers on a Modbus TCP or RTU-over-TCP device
 *
 * Usage:
 *   example_client <host> <port> <tcp|rtu> read <address> <count> [unit_id]
 *   example_client <host> <port> <tcp|rtu> write <address> <value> [value ...]
 *
 * Set FPSSMB_LOG_LEVEL=debug to see the library's frame diagnostics.
 */

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fpss_modbus/client/modbus_client.hpp"
#include "fpss_modbus/transport/socket_transport.hpp"

namespace {

std::optional<uint16_t> ParseU16(const char *text) {
  errno = 0;
  char *end = nullptr;
  unsigned long value = std::strtoul(text, &end, 0);
  if (errno != 0 || end == text || *end != '\0' || value > 0xFFFF) {
    return {};
  }
  return static_cast<uint16_t>(value);
}

void PrintUsage(const char *program) {
  std::cerr << "usage: " << program << " <host> <port> <tcp|rtu> read <address> <count> [unit_id]\n"
            << "       " << program << " <host> <port> <tcp|rtu> write <address> <value> [value ...]\n";
}

void PrintError(const fpssmb::ModbusError &error) {
  std::cerr << "  failed: " << fpssmb::ToString(error.kind);
  if (error.kind == fpssmb::ErrorKind::kExceptionResponse) {
    std::cerr << " (" << fpssmb::ExceptionCodeToString(error.exception_code) << ")";
  }
  std::cerr << "\n";
}

}  // namespace

int main(int argc, char **argv) {
  using fpssmb::ClientOptions;
  using fpssmb::ConnectionState;
  using fpssmb::FramingMode;
  using fpssmb::ModbusClient;
  using fpssmb::SocketTransport;

  if (argc < 7) {
    PrintUsage(argv[0]);
    return 2;
  }

  const std::string host = argv[1];
  const auto port = ParseU16(argv[2]);
  const std::string mode = argv[3];
  const std::string operation = argv[4];
  const auto address = ParseU16(argv[5]);
  if (!port.has_value() || !address.has_value() || (mode != "tcp" && mode != "rtu")) {
    PrintUsage(argv[0]);
    return 2;
  }

  ClientOptions options;
  options.framing = mode == "tcp" ? FramingMode::kTcp : FramingMode::kRtuOverTcp;

  bool ready = false;
  ModbusClient client(std::make_unique<SocketTransport>(fpssmb::SocketTransportOptions{.receive_timeout_ms = 3000}),
                      options);

  client.Connect(host, *port, [&ready](ConnectionState state) {
    std::cout << "state: " << fpssmb::ToString(state) << "\n";
    ready = ready || state == ConnectionState::kReady;
  });
  if (!ready) {
    std::cerr << "could not connect to " << host << ":" << *port << "\n";
    return 1;
  }

  int exit_code = 1;
  if (operation == "read") {
    const auto count = ParseU16(argv[6]);
    const auto unit_id = argc > 7 ? ParseU16(argv[7]) : std::optional<uint16_t>{options.default_unit_id};
    if (!count.has_value() || !unit_id.has_value() || *unit_id > 0xFF) {
      PrintUsage(argv[0]);
      return 2;
    }
    std::cout << "Reading " << *count << " holding registers at " << *address << "...\n";
    client.ReadHoldingRegisters(static_cast<uint8_t>(*unit_id), *address, *count,
                                [&exit_code, first = *address](fpssmb::ReadResult result) {
                                  if (!result) {
                                    PrintError(result.Error());
                                    return;
                                  }
                                  for (size_t i = 0; i < result->size(); ++i) {
                                    std::cout << "  Register[" << first + i << "] = " << (*result)[i] << "\n";
                                  }
                                  exit_code = 0;
                                });
  } else if (operation == "write") {
    std::vector<uint16_t> values;
    for (int i = 6; i < argc; ++i) {
      auto value = ParseU16(argv[i]);
      if (!value.has_value()) {
        PrintUsage(argv[0]);
        return 2;
      }
      values.push_back(*value);
    }
    std::cout << "Writing " << values.size() << " holding registers at " << *address << "...\n";
    client.WriteHoldingRegisters(*address, values, [&exit_code](fpssmb::WriteResult result) {
      if (!result) {
        PrintError(result.Error());
        return;
      }
      std::cout << "  acknowledged\n";
      exit_code = 0;
    });
  } else {
    PrintUsage(argv[0]);
    return 2;
  }

  client.Close();
  return exit_code;
}
