#include "streamcodec/frame_reader.hpp"
#include "streamcodec/json_streams.hpp"
#include "streamcodec/options.hpp"
#include "streamcodec/source.hpp"
#include "streamcodec/sse_assembler.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

void print_usage(const char* program)
{
  std::cerr << "Usage: " << program << " <lines|json-lines|json-seq|sse>\n"
            << "Decodes stdin and prints one JSON object per decoded item.\n"
            << "Set STREAMCODEC_LOG=debug to trace stream progress on stderr.\n";
}

template <typename Reader>
int print_all(Reader& reader)
{
  std::size_t count = 0;
  while (auto item = reader.next())
  {
    std::cout << nlohmann::json(*item).dump() << '\n';
    ++count;
  }
  std::cerr << count << " item(s) decoded\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc != 2)
  {
    print_usage(argv[0]);
    return 1;
  }

  const std::string format = argv[1];

  try
  {
    streamcodec::StreamOptions options;
    options.logger = [](streamcodec::LogLevel level, const std::string& message, const nlohmann::json& details) {
      std::cerr << "[" << streamcodec::to_string(level) << "] " << message << " " << details.dump() << '\n';
    };
    options = streamcodec::resolve_stream_options(std::move(options));

    streamcodec::IstreamByteSource source(std::cin);

    if (format == "lines")
    {
      streamcodec::LineReader reader(source, options);
      return print_all(reader);
    }
    if (format == "json-lines")
    {
      streamcodec::JsonLinesReader<nlohmann::json> reader(source, options);
      return print_all(reader);
    }
    if (format == "json-seq")
    {
      streamcodec::JsonSequenceReader<nlohmann::json> reader(source, options);
      return print_all(reader);
    }
    if (format == "sse")
    {
      streamcodec::ServerSentEventReader reader(source, options);
      return print_all(reader);
    }

    print_usage(argv[0]);
    return 1;
  }
  catch (const streamcodec::StreamCodecError& error)
  {
    std::cerr << "Stream error: " << error.what() << '\n';
    return 2;
  }
  catch (const nlohmann::json::exception& error)
  {
    std::cerr << "JSON error: " << error.what() << '\n';
    return 2;
  }
}
