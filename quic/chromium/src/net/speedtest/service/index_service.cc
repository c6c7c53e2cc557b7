#include "net/speedtest/service/index_service.h"
#include "net/speedtest/size_name.h"

#include <fstream>
#include <streambuf>

#include "base/strings/stringprintf.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace {

const char kPageHeader[] =
  "<!DOCTYPE html>\n"
  "<html>\n"
  "<head>\n"
  "<meta charset=\"utf-8\">\n"
  "<title>Speedtest</title>\n"
  "</head>\n"
  "<body>\n"
  "<h1>Speedtest</h1>\n"
  "<p>Download one of the files below to measure your connection.</p>\n"
  "<ul>\n";

const char kPageFooter[] =
  "</ul>\n"
  "</body>\n"
  "</html>\n";

}

namespace speedtest {

IndexService::IndexService(
  const std::string& file,
  const std::vector<std::string>& sizes
) : file_(file)
  , sizes_(sizes) {}

IndexService::~IndexService() {}

bool IndexService::Initialize() {
  if (file_.empty()) {
    page_ = BuildPage(sizes_);
    return true;
  }

  std::ifstream stream(file_, std::ios::binary);
  if (!stream.is_open()) {
    QUIC_LOG(ERROR) << "Cannot read index page " << file_;
    return false;
  }
  page_.assign((std::istreambuf_iterator<char>(stream)),
               std::istreambuf_iterator<char>());
  QUIC_LOG(INFO) << "[index] " << file_ << " : " << page_.size() << " bytes";
  return true;
}

// static
std::string IndexService::BuildPage(const std::vector<std::string>& sizes) {
  std::string page = kPageHeader;
  for (const auto& size : sizes) {
    uint64_t bytes = 0;
    if (ParseSizeName(size, &bytes) != SIZE_OK) {
      QUIC_LOG(WARNING) << "Skipping index entry " << size;
      continue;
    }
    page += base::StringPrintf(
      "<li><a href=\"/%s.bin\">%s</a> (%llu bytes)</li>\n",
      size.c_str(), size.c_str(), static_cast<unsigned long long>(bytes));
  }
  page += kPageFooter;
  return page;
}

}
