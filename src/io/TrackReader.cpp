#include "io/TrackReader.hpp"
#include "models/TrackJson.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tc {

std::string TrackReader::slurp(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("cannot open " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

Track TrackReader::read_file(const std::string &path) {
  return from_text(slurp(path));
}

Track TrackReader::from_text(const std::string &text) {
  return from_json(nlohmann::json::parse(text));
}

Track TrackReader::from_json(const nlohmann::json &doc) {
  const nlohmann::json *arr = &doc;
  if (doc.is_object()) {
    if (!doc.contains("samples") || !doc["samples"].is_array())
      throw std::runtime_error("track object has no 'samples' array");
    arr = &doc["samples"];
  } else if (!doc.is_array()) {
    throw std::runtime_error("track must be an array or an object");
  }

  Track out;
  out.reserve(arr->size());
  for (std::size_t i = 0; i < arr->size(); ++i) {
    try {
      out.push_back((*arr)[i].get<Sample>());
    } catch (const std::runtime_error &e) {
      throw std::runtime_error("sample " + std::to_string(i) + ": " +
                               e.what());
    }
  }
  return out;
}

} // namespace tc
