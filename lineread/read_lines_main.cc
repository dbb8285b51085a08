#include "lineread/config.hh"
#include "lineread/line_reader.hh"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
class SizeNotify {
  public:
    SizeNotify(std::size_t &out) : behind_(out) {}

    void operator()(const std::string &from) {
      behind_ = lineread::ParseSize(from);
    }

  private:
    std::size_t &behind_;
};

class PolicyNotify {
  public:
    PolicyNotify(lineread::DecodeErrorPolicy &out) : behind_(out) {}

    void operator()(const std::string &from) {
      behind_ = lineread::ParseDecodeErrorPolicy(from);
    }

  private:
    lineread::DecodeErrorPolicy &behind_;
};

void ReadOne(lineread::LineReader &reader, bool print) {
  boost::string_ref line;
  while (reader.ReadLine(line)) {
    if (print) std::cout.write(line.data(), line.size()) << '\n';
  }
}

} // namespace

int main(int argc, char *argv[]) {
  namespace po = boost::program_options;
  try {
    lineread::Config config;
    std::vector<std::string> files;
    bool print, progress;
    po::options_description options("read_lines options");
    options.add_options()
      ("help,h", po::bool_switch(), "Show this help message")
      ("chunk_size,c", po::value<std::string>()->notifier(SizeNotify(config.chunk_size)), "Bytes per chunk, with an optional suffix like 64k or 4M.  Defaults depend on the compression format.")
      ("encoding,e", po::value<std::string>(&config.encoding)->default_value("UTF-8"), "Encoding of the input, by any name ICU knows")
      ("errors", po::value<std::string>()->notifier(PolicyNotify(config.errors))->default_value("replace"), "What to do with malformed input: strict, replace, or ignore")
      ("strip_cr", po::bool_switch(&config.strip_cr), "Remove carriage returns before line feeds")
      ("print,p", po::bool_switch(&print), "Copy lines to stdout")
      ("progress", po::bool_switch(&progress), "Show a progress bar on stderr for regular files")
      ("debug", po::bool_switch(&config.debug), "Report timing of each file on stderr")
      ("file", po::value<std::vector<std::string> >(&files), "Files to read.  - or nothing means stdin.");
    po::positional_options_description positional;
    positional.add("file", -1);
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);
    if (vm["help"].as<bool>()) {
      std::cerr <<
        "Reads text files line by line and reports how fast.  Files ending in .gz,\n"
        ".bz2, .xz, or .lzma are decompressed.  Lines are converted to UTF-8.\n\n"
        "Usage: " << argv[0] << " [options] [file ...]\n\n" << options << std::endl;
      return 1;
    }
    po::notify(vm);
    if (progress) config.show_progress = &std::cerr;
    if (files.empty()) files.push_back("-");

    std::ios_base::sync_with_stdio(false);
    for (std::vector<std::string>::const_iterator i = files.begin(); i != files.end(); ++i) {
      std::unique_ptr<lineread::LineReader> reader(*i == "-" ?
          new lineread::LineReader(0, "<stdin>", config) :
          new lineread::LineReader(*i, config));
      ReadOne(*reader, print);
      std::cerr << reader->GetStats() << std::endl;
    }
    std::cout.flush();
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
