/*
 * File: clients/publish_client/publish_client_main.cpp
 * Project: Receipt Event Relay
 * Purpose: Command-line producer: submit one receipt event to the topic
 * Notes:
 *  - Same submission path the processing pipeline uses; the timestamp is
 *    stamped by the publisher
 * Last updated: 2026-10-17
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "common/event_record.hpp"
#include "relay_log.hpp"
#include "relay_publisher.hpp"
#include "relay_pubsub.hpp"

int main(int argc, char **argv)
{
    std::string project = "receipt-tracking-application";
    std::string topic = "receipt-updates";
    std::string pubsub = "https://pubsub.googleapis.com";
    std::string token;
    std::string type = "receipt_update";
    std::string status;
    PartialEvent ev;

    if (const char *emu = std::getenv("PUBSUB_EMULATOR_HOST"); emu && *emu)
        pubsub = std::string("http://") + emu;
    if (const char *tok = std::getenv("PUBSUB_ACCESS_TOKEN"); tok && *tok)
        token = tok;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--project" && i + 1 < argc)
            project = argv[++i];
        else if (a == "--topic" && i + 1 < argc)
            topic = argv[++i];
        else if (a == "--pubsub" && i + 1 < argc)
            pubsub = argv[++i];
        else if (a == "--token" && i + 1 < argc)
            token = argv[++i];
        else if (a == "--type" && i + 1 < argc)
            type = argv[++i];
        else if (a == "--status" && i + 1 < argc)
            status = argv[++i];
        else if (a == "--receipt" && i + 1 < argc)
            ev.subject_id = argv[++i];
        else if (a == "--user" && i + 1 < argc)
            ev.owner_id = argv[++i];
        else if (a == "--verbose")
            spdlog::set_level(spdlog::level::debug);
        else
        {
            std::cerr << "usage: relay_publish --status s --receipt id --user uid [--type t]\n"
                         "                     [--project p] [--topic t] [--pubsub url] [--token bearer]\n";
            return 2;
        }
    }

    if (!parse_kind(type, ev.kind))
    {
        std::cerr << "relay_publish: unknown --type '" << type << "'\n";
        return 2;
    }
    if (!parse_status(status, ev.status))
    {
        std::cerr << "relay_publish: --status must be received|processing_started|processed|failed\n";
        return 2;
    }
    if (ev.subject_id.empty() || ev.owner_id.empty())
    {
        std::cerr << "relay_publish: --receipt and --user are required\n";
        return 2;
    }

    try
    {
        PubsubRestClient channel{PubsubEndpoint::parse(pubsub), token};
        Publisher publisher{channel};
        auto id = publisher.submit(project, topic, ev);
        std::cout << id << "\n";
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "relay_publish: " << e.what() << "\n";
        return 1;
    }
}
