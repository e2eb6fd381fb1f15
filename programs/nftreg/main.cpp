#include "replay.hpp"

#include <nftreg/Chain.hpp>
#include <nftreg/check.hpp>
#include <nftreg/log.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <rapidjson/error/en.h>

#include <fstream>
#include <iostream>
#include <iterator>

using namespace nftreg;

namespace
{
   const char usage[] = "USAGE: nftreg [OPTIONS] script.json";

   std::string readFile(const std::string& path)
   {
      std::ifstream in(path);
      check(in.is_open(), "cannot open " + path);
      return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
   }
}  // namespace

int main(int argc, char* argv[])
{
   std::string   script;
   std::string   config;
   std::string   byteCost;
   std::uint64_t recordOverhead;

   namespace po = boost::program_options;

   po::options_description desc("nftreg");
   po::options_description common_opts("Options");
   auto                    opt = common_opts.add_options();
   opt("byte-cost", po::value(&byteCost)->default_value(to_string(defaultStorageByteCost)),
       "Price of one byte of storage, in the smallest unit of value");
   opt("record-overhead",
       po::value(&recordOverhead)->default_value(DatabaseConfig{}.recordOverhead),
       "Bytes charged for every stored record on top of its key and value");
   opt("logger.level", po::value<loggers::level>()->value_name("level"),
       "Minimum level of log messages: debug, info, notice, warning, or error");
   desc.add(common_opts);
   desc.add_options()("help,h", "Show this message")(
       "config,c", po::value(&config)->value_name("path"), "Read options from a config file")(
       "script", po::value(&script)->value_name("path"), "JSON action script");

   po::positional_options_description positional;
   positional.add("script", 1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                vm);
      if (auto it = vm.find("config"); it != vm.end())
      {
         std::ifstream in(it->second.as<std::string>());
         check(in.is_open(), "cannot open " + it->second.as<std::string>());
         po::store(po::parse_config_file(in, common_opts), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help") || script.empty())
   {
      std::cerr << usage << "\n\n";
      std::cerr << desc << "\n";
      return 1;
   }

   try
   {
      loggers::configure(vm);
      auto& logger = loggers::generic::get();

      auto cost = parseAmount(byteCost);
      check(cost.has_value(), "invalid byte-cost: " + byteCost);

      ChainConfig chainConfig;
      chainConfig.storageByteCost         = *cost;
      chainConfig.database.recordOverhead = recordOverhead;
      Chain chain{chainConfig};

      auto text = readFile(script);
      rapidjson::Document doc;
      doc.Parse(text.c_str(), text.size());
      check(!doc.HasParseError(), script + ": " + rapidjson::GetParseError_En(doc.GetParseError()));
      check(doc.IsArray(), "script must be an array of actions");

      NFTREG_LOG(logger, info) << "replaying " << doc.Size() << " actions from " << script;
      replay(chain, doc, std::cout);
      NFTREG_LOG(logger, info) << "storage used: " << chain.database().storageUsage() << " bytes";
   }
   catch (std::exception& e)
   {
      NFTREG_LOG(loggers::generic::get(), error) << e.what();
      return 1;
   }
   return 0;
}
