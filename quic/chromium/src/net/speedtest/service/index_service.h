#ifndef SPEEDTEST_SERVICE_INDEX_SERVICE_H_
#define SPEEDTEST_SERVICE_INDEX_SERVICE_H_

#include <string>
#include <vector>

namespace speedtest {

// Holds the page served at "/". The page is either read once from a file
// or generated from a list of size names, one download link per size.
class IndexService {
 public:
  IndexService(const std::string& file, const std::vector<std::string>& sizes);
  IndexService(const IndexService&) = delete;
  IndexService& operator=(const IndexService&) = delete;
  ~IndexService();

  // Loads or builds the page. Fails only if the configured file cannot be
  // read.
  bool Initialize();

  const std::string& page() const { return page_; }

  static std::string BuildPage(const std::vector<std::string>& sizes);
 private:
  const std::string file_;
  const std::vector<std::string> sizes_;

  std::string page_;
};

}

#endif
