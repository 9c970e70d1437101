#include "client.hpp"
#include "club_lookup.hpp"
#include "config.hpp"
#include "models.hpp"
#include "tokens.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct CliOptions {
    std::string command;
    std::string argument;
    std::string token;
    long        everyMs    = -1;   // -1 = keep environment / default
    int         burst      = -1;
    int         maxRetries = -1;
    bool        verbose    = false;
};

static void printUsage() {
    std::cout
        << "Usage: campfire_cli [options] <command> <argument>\n\n"
        << "Commands:\n"
        << "  resolve <meetup-url>        Print the event id of a meetup link\n"
        << "  short <url>                 Expand a cmpf.re short link\n"
        << "  event <meetup-url|id>       Fetch an event\n"
        << "  club <club-url|id|text>     Fetch a club\n"
        << "  past-meetups <club-id>      Fetch every archived meetup of a club\n\n"
        << "Options:\n"
        << "  --every-ms N     Rate limiter interval   (default: 1000)\n"
        << "  --burst N        Rate limiter burst      (default: 40)\n"
        << "  --max-retries N  Attempts per request    (default: 3)\n"
        << "  --token T        Bearer token            (default: $CAMPFIRE_TOKEN)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n\n"
        << "Without --token the bearer token is read from CAMPFIRE_TOKEN.\n";
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--every-ms") && i + 1 < argc) {
            opts.everyMs = std::stol(argv[++i]);
        } else if ((arg == "--burst") && i + 1 < argc) {
            opts.burst = std::stoi(argv[++i]);
        } else if ((arg == "--max-retries") && i + 1 < argc) {
            opts.maxRetries = std::stoi(argv[++i]);
        } else if ((arg == "--token") && i + 1 < argc) {
            opts.token = argv[++i];
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        printUsage();
        std::exit(1);
    }
    opts.command  = positional[0];
    opts.argument = positional[1];
    return opts;
}

static bool looksLikeUrl(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

static void printEvent(const campfire::Event& e) {
    std::cout
        << "Event:      " << e.id << "\n"
        << "Name:       " << e.name << "\n"
        << "Club:       " << e.club.name << " (" << e.clubId << ")\n"
        << "Starts:     " << e.eventTime << "\n"
        << "Ends:       " << e.eventEndTime << "\n"
        << "Address:    " << e.address << "\n"
        << "Members:    " << e.members.totalCount << "\n"
        << "Checked in: " << e.checkedInMembersCount.value_or(0) << "\n";
}

static void printClub(const campfire::Club& c) {
    std::cout
        << "Club:       " << c.id << "\n"
        << "Name:       " << c.name << "\n"
        << "Game:       " << c.game.value_or("-") << "\n"
        << "Visibility: " << c.visibility.value_or("-") << "\n"
        << "Creator:    " << c.creator.displayName
                          << " (" << c.creator.username << ")\n";
}

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parseArgs(argc, argv);

        auto settings = campfire::CampfireSettings::fromEnvironment();
        campfire::CampfireConfig config(
            opts.everyMs >= 0 ? std::chrono::milliseconds(opts.everyMs)
                              : settings.config.every(),
            opts.burst >= 0 ? opts.burst : settings.config.burst(),
            opts.maxRetries >= 0 ? opts.maxRetries : settings.config.maxRetries());

        if (opts.verbose) {
            std::cerr
                << "=== campfire_cli ===\n"
                << "Command:     " << opts.command << "\n"
                << "Every:       " << config.every().count() << " ms\n"
                << "Burst:       " << config.burst() << "\n"
                << "Max retries: " << config.maxRetries() << "\n"
                << "====================\n\n";
        }

        auto tokens = campfire::chainedTokenSupplier(
            {{"cli", campfire::staticTokenSupplier(opts.token)},
             {"env", campfire::environmentTokenSupplier()}},
            opts.verbose);

        campfire::CampfireClient client(config, tokens, opts.verbose);

        if (opts.command == "resolve") {
            std::cout << client.resolveEventId(opts.argument) << "\n";
        } else if (opts.command == "short") {
            std::cout << client.resolveShortUrl(opts.argument) << "\n";
        } else if (opts.command == "event") {
            printEvent(looksLikeUrl(opts.argument)
                           ? client.resolveEvent(opts.argument)
                           : client.getEvent(opts.argument));
        } else if (opts.command == "club") {
            printClub(client.lookupClub(opts.argument,
                                        looksLikeUrl(opts.argument)
                                            ? campfire::ClubLookupKind::Url
                                            : campfire::ClubLookupKind::Id));
        } else if (opts.command == "past-meetups") {
            const auto events = client.getPastMeetups(opts.argument);

            std::cout << "\n--- Past Meetups (" << events.size() << ") ---\n";
            for (std::size_t i = 0; i < events.size(); ++i) {
                const auto& e = events[i];
                std::cout << std::setw(4) << (i + 1) << "  "
                          << std::left << std::setw(38) << e.id << "  "
                          << std::setw(40) << e.name << "  "
                          << std::right << e.eventTime << "\n";
            }
        } else {
            std::cerr << "Unknown command: " << opts.command << "\n\n";
            printUsage();
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
