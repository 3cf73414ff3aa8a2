// Copyright 2019-present MongoDB Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <driver/ResolveDriver.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/exception.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <boost/stacktrace.hpp>

#include <bsoncxx/json.hpp>

#include <config/Node.hpp>

#include <safewrite/ExecutionContext.hpp>
#include <safewrite/OptionsResolver.hpp>
#include <safewrite/PersistenceConfig.hpp>
#include <safewrite/Safety.hpp>
#include <safewrite/conventions.hpp>

namespace safewrite::driver {
namespace {

namespace fs = boost::filesystem;

// Stands in for the entity whose write is being resolved.
class Request : public Safety<Request> {
public:
    explicit Request(WriteConcernOptions explicitOptions)
        : _explicitOptions{std::move(explicitOptions)} {}

    WriteConcernOptions resolve(ExecutionContext& context) const {
        return mergeSafetyOptions(_explicitOptions, context);
    }

private:
    WriteConcernOptions _explicitOptions;
};

std::string loadFile(const std::string& source) {
    std::ifstream in{source};
    if (!in) {
        BOOST_LOG_TRIVIAL(error) << "Error loading yaml from " << source;
        throw std::ios_base::failure("Cannot read " + source);
    }
    std::stringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

// Empty or null YAML is no options at all.
WriteConcernOptions parseOptions(const std::string& yaml, const std::string& name) {
    NodeSource source{yaml, name};
    const auto& root = source.root();
    if (root.isNull()) {
        return WriteConcernOptions{};
    }
    return root.to<WriteConcernOptions>();
}

ResolveDriver::OutcomeCode doRunLogic(const ResolveDriver::ProgramOptions& options,
                                      std::ostream& out) {
    // setup logging as the first thing we do.
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= options.logVerbosity);

    if (!fs::is_regular_file(options.configFile)) {
        BOOST_LOG_TRIVIAL(error) << "No such config file '" << options.configFile << "'";
        return ResolveDriver::OutcomeCode::kUserException;
    }

    NodeSource configSource{loadFile(options.configFile), options.configFile};
    const PersistenceConfig config{configSource.root()};
    ExecutionContext context{config};

    Request request{parseOptions(options.explicitOptions, "--explicit")};
    auto resolve = [](Request& r, ExecutionContext& ctx) { return r.resolve(ctx); };

    WriteConcernOptions effective;
    if (options.unsafely) {
        effective = request.unsafely().execute(context, resolve);
    } else if (options.safely) {
        effective = request.safely(parseOptions(*options.safely, "--safely"))
                        .execute(context, resolve);
    } else {
        effective = request.resolve(context);
    }

    const auto writeConcern = toWriteConcern(effective);
    BOOST_LOG_TRIVIAL(debug) << "Driver write concern "
                             << bsoncxx::to_json(writeConcern.to_document().view(),
                                                 bsoncxx::ExtendedJsonMode::k_relaxed);

    out << bsoncxx::to_json(effective.toBson().view(), bsoncxx::ExtendedJsonMode::k_relaxed)
        << std::endl;
    return ResolveDriver::OutcomeCode::kSuccess;
}

}  // namespace


ResolveDriver::OutcomeCode ResolveDriver::run(const ResolveDriver::ProgramOptions& options,
                                              std::ostream& out) const {
    try {
        return doRunLogic(options, out);
    } catch (const boost::exception& x) {
        BOOST_LOG_TRIVIAL(error) << "Caught boost::exception "
                                 << boost::diagnostic_information(x, true)
                                 << boost::stacktrace::stacktrace();
        return ResolveDriver::OutcomeCode::kBoostException;
    } catch (const std::exception& x) {
        BOOST_LOG_TRIVIAL(error) << "Caught std::exception " << x.what() << std::endl
                                 << boost::diagnostic_information(x, true)
                                 << boost::stacktrace::stacktrace();
        return ResolveDriver::OutcomeCode::kStandardException;
    }
}


namespace {

boost::log::trivial::severity_level parseVerbosity(const std::string& level) {
    boost::log::trivial::severity_level out;
    if (!boost::log::trivial::from_string(level.data(), level.size(), out)) {
        throw std::invalid_argument("Invalid verbosity level '" + level +
                                    "'. Need one of trace/debug/info/warning/error/fatal");
    }
    return out;
}

}  // namespace

const std::string RUNNER_NAME = "safewrite-resolve";

ResolveDriver::ProgramOptions::ProgramOptions(int argc, char** argv) {
    namespace po = boost::program_options;

    std::ostringstream progDescStream;
    // Section headers are prefaced with new lines.
    progDescStream << "\nUsage:\n";
    progDescStream << "    " << RUNNER_NAME << " [options] <config-file>\n";
    progDescStream << R"(
    Prints the write concern a persistence call would use given the
    PersistInSafeMode and DefaultWriteConcern settings in <config-file>.
    )" << "\n";

    progDescStream << "Options";
    po::options_description progDescription{progDescStream.str()};
    po::positional_options_description positional;

    // clang-format off
    progDescription.add_options()
            ("help,h",
             "Show help message")
            ("config-file,c",
             po::value<std::string>(),
             "Path to persistence configuration yaml file. "
             "Can also specify as the positional argument.")
            ("explicit,e",
             po::value<std::string>()->default_value("{}"),
             "Options passed to the call itself, as yaml. E.g. '{w: 2, comment: audit}'.")
            ("safely,s",
             po::value<std::string>(),
             "Run the call under safely(). An integer node count or a yaml map.")
            ("unsafely,u",
             "Run the call under unsafely().")
            ("verbosity,v",
              po::value<std::string>()->default_value("info"),
              "Log severity for boost logging. Valid values are trace/debug/info/warning/error/fatal.");

    positional.add("config-file", 1);
    // clang-format on

    {
        auto stream = std::ostringstream();
        stream << progDescription;
        this->description = stream.str();
    }

    po::variables_map vm;
    try {
        auto run = po::command_line_parser(argc, argv)
                       .options(progDescription)
                       .positional(positional)
                       .run();
        po::store(run, vm);
        po::notify(vm);
        this->logVerbosity = parseVerbosity(vm["verbosity"].as<std::string>());
    } catch (const std::exception& x) {
        std::cerr << "ERROR: " << x.what() << std::endl;
        this->runMode = RunMode::kHelp;
        this->parseOutcome = OutcomeCode::kUserException;
        return;
    }

    if (vm.count("help") >= 1) {
        this->runMode = RunMode::kHelp;
        return;
    }

    if (!vm.count("config-file")) {
        std::cerr << "ERROR: missing config file" << std::endl;
        this->runMode = RunMode::kHelp;
        this->parseOutcome = OutcomeCode::kUserException;
        return;
    }
    this->configFile = vm["config-file"].as<std::string>();

    if (vm.count("safely") && vm.count("unsafely")) {
        std::cerr << "ERROR: --safely and --unsafely are mutually exclusive" << std::endl;
        this->runMode = RunMode::kHelp;
        this->parseOutcome = OutcomeCode::kUserException;
        return;
    }

    this->explicitOptions = vm["explicit"].as<std::string>();
    if (vm.count("safely")) {
        this->safely = vm["safely"].as<std::string>();
    }
    this->unsafely = vm.count("unsafely") > 0;
}

}  // namespace safewrite::driver
