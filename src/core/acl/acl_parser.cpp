// src/core/acl/acl_parser.cpp
#include "acl_parser.hpp"
#include "acl_engine.hpp"
#include "../../common/network_utils.hpp"
#include "../../common/utils.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Acl
        {
            std::optional<AclAction> AclParser::parseAction(const std::string &token)
            {
                std::string lower = Common::Utils::toLowerCase(token);
                if (lower == "permit")
                {
                    return AclAction::PERMIT;
                }
                if (lower == "deny")
                {
                    return AclAction::DENY;
                }
                return std::nullopt;
            }

            std::optional<uint16_t> AclParser::parsePort(const std::string &token)
            {
                int port = Common::NetworkUtils::getPortNumber(token);
                if (!Common::NetworkUtils::isValidPort(port))
                {
                    return std::nullopt;
                }
                return static_cast<uint16_t>(port);
            }

            std::optional<uint8_t> AclParser::parseProtocol(const std::string &token)
            {
                int protocol = Common::NetworkUtils::getProtocolNumber(token);
                if (protocol < 0 || protocol > 255)
                {
                    return std::nullopt;
                }
                return static_cast<uint8_t>(protocol);
            }

            bool AclParser::parseAddress(const std::vector<std::string> &tokens, size_t &index,
                                         Common::IPv4Address &address, Common::WildcardMask &wildcard,
                                         bool wildcard_optional)
            {
                if (index >= tokens.size())
                {
                    return false;
                }

                std::string token = Common::Utils::toLowerCase(tokens[index]);
                if (token == "any")
                {
                    address = Common::IPv4Address::any();
                    wildcard = Common::WildcardMask::any();
                    index++;
                    return true;
                }

                if (token == "host")
                {
                    if (index + 1 >= tokens.size())
                    {
                        return false;
                    }
                    auto host = Common::IPv4Address::parse(tokens[index + 1]);
                    if (!host)
                    {
                        return false;
                    }
                    address = *host;
                    wildcard = Common::WildcardMask::host();
                    index += 2;
                    return true;
                }

                auto network = Common::IPv4Address::parse(tokens[index]);
                if (!network)
                {
                    return false;
                }
                index++;

                std::optional<Common::WildcardMask> mask;
                if (index < tokens.size())
                {
                    mask = Common::WildcardMask::parse(tokens[index]);
                }
                if (mask)
                {
                    index++;
                }
                else if (!wildcard_optional)
                {
                    return false;
                }

                address = *network;
                wildcard = mask ? *mask : Common::WildcardMask::host();
                return true;
            }

            bool AclParser::parsePortMatch(const std::vector<std::string> &tokens, size_t &index,
                                           std::optional<PortMatch> &match)
            {
                if (index >= tokens.size())
                {
                    return true;
                }

                std::string op = Common::Utils::toLowerCase(tokens[index]);
                PortMatch result;
                if (op == "eq")
                {
                    result.op = PortOperator::EQ;
                }
                else if (op == "neq")
                {
                    result.op = PortOperator::NEQ;
                }
                else if (op == "lt")
                {
                    result.op = PortOperator::LT;
                }
                else if (op == "gt")
                {
                    result.op = PortOperator::GT;
                }
                else if (op == "range")
                {
                    result.op = PortOperator::RANGE;
                }
                else
                {
                    return true;   // không có điều kiện port
                }

                if (index + 1 >= tokens.size())
                {
                    return false;
                }
                auto start = parsePort(tokens[index + 1]);
                if (!start)
                {
                    return false;
                }
                result.start = *start;
                index += 2;

                if (result.op == PortOperator::RANGE)
                {
                    if (index >= tokens.size())
                    {
                        return false;
                    }
                    auto end = parsePort(tokens[index]);
                    if (!end || *end < result.start)
                    {
                        return false;
                    }
                    result.end = *end;
                    index++;
                }

                match = result;
                return true;
            }

            std::optional<AclEntry> AclParser::parseStandardEntry(const std::vector<std::string> &tokens)
            {
                if (tokens.size() < 2)
                {
                    return std::nullopt;
                }

                auto action = parseAction(tokens[0]);
                if (!action)
                {
                    return std::nullopt;
                }

                AclEntry entry;
                entry.action = *action;

                size_t index = 1;
                if (!parseAddress(tokens, index, entry.source, entry.source_wildcard, true))
                {
                    return std::nullopt;
                }

                for (; index < tokens.size(); ++index)
                {
                    if (Common::Utils::toLowerCase(tokens[index]) == "log")
                    {
                        entry.log = true;
                    }
                    else
                    {
                        return std::nullopt;
                    }
                }
                return entry;
            }

            std::optional<AclEntry> AclParser::parseExtendedEntry(const std::vector<std::string> &tokens)
            {
                if (tokens.size() < 4)
                {
                    return std::nullopt;
                }

                auto action = parseAction(tokens[0]);
                auto protocol = parseProtocol(tokens[1]);
                if (!action || !protocol)
                {
                    return std::nullopt;
                }

                AclEntry entry;
                entry.action = *action;
                entry.protocol = *protocol;
                bool has_ports = entry.protocol == Packet::IpProtocol::TCP || entry.protocol == Packet::IpProtocol::UDP;

                size_t index = 2;
                if (!parseAddress(tokens, index, entry.source, entry.source_wildcard, false))
                {
                    return std::nullopt;
                }
                if (has_ports && !parsePortMatch(tokens, index, entry.source_port))
                {
                    return std::nullopt;
                }

                if (!parseAddress(tokens, index, entry.destination, entry.destination_wildcard, false))
                {
                    return std::nullopt;
                }
                if (has_ports && !parsePortMatch(tokens, index, entry.destination_port))
                {
                    return std::nullopt;
                }

                for (; index < tokens.size(); ++index)
                {
                    std::string option = Common::Utils::toLowerCase(tokens[index]);
                    if (option == "established" && entry.protocol == Packet::IpProtocol::TCP)
                    {
                        entry.established = true;
                    }
                    else if (option == "log")
                    {
                        entry.log = true;
                    }
                    else
                    {
                        return std::nullopt;
                    }
                }
                return entry;
            }

            std::optional<std::pair<int, AclEntry>> AclParser::parseAccessListCommand(const std::string &line)
            {
                std::vector<std::string> tokens = Common::Utils::tokenize(line);
                if (tokens.size() < 3 || Common::Utils::toLowerCase(tokens[0]) != "access-list")
                {
                    return std::nullopt;
                }

                uint32_t number = 0;
                if (!Common::Utils::parseUnsigned(tokens[1], number))
                {
                    return std::nullopt;
                }

                std::vector<std::string> rest(tokens.begin() + 2, tokens.end());
                auto type = AclEngine::typeForNumber(static_cast<int>(number));
                if (!type)
                {
                    return std::nullopt;
                }

                auto entry = *type == AclType::STANDARD ? parseStandardEntry(rest) : parseExtendedEntry(rest);
                if (!entry)
                {
                    return std::nullopt;
                }
                return std::make_pair(static_cast<int>(number), *entry);
            }

            // ==================== Formatting ====================

            std::string AclParser::formatAddress(const Common::IPv4Address &address, const Common::WildcardMask &wildcard)
            {
                if (wildcard.toUint32() == 0xFFFFFFFFu)
                {
                    return "any";
                }
                if (wildcard.toUint32() == 0)
                {
                    return "host " + address.toString();
                }
                return address.toString() + " " + wildcard.toString();
            }

            std::string AclParser::formatPortMatch(const PortMatch &match)
            {
                auto name = [](uint16_t port) { return Common::NetworkUtils::getPortService(port); };

                switch (match.op)
                {
                case PortOperator::EQ:
                    return "eq " + name(match.start);
                case PortOperator::NEQ:
                    return "neq " + name(match.start);
                case PortOperator::LT:
                    return "lt " + name(match.start);
                case PortOperator::GT:
                    return "gt " + name(match.start);
                case PortOperator::RANGE:
                    return "range " + name(match.start) + " " + name(match.end);
                }
                return "";
            }

            std::string AclParser::formatEntry(const AclEntry &entry, AclType type)
            {
                std::vector<std::string> parts;
                parts.push_back(aclActionToString(entry.action));

                if (type == AclType::STANDARD)
                {
                    parts.push_back(formatAddress(entry.source, entry.source_wildcard));
                }
                else
                {
                    parts.push_back(Common::NetworkUtils::getProtocolName(entry.protocol));
                    parts.push_back(formatAddress(entry.source, entry.source_wildcard));
                    if (entry.source_port)
                    {
                        parts.push_back(formatPortMatch(*entry.source_port));
                    }
                    parts.push_back(formatAddress(entry.destination, entry.destination_wildcard));
                    if (entry.destination_port)
                    {
                        parts.push_back(formatPortMatch(*entry.destination_port));
                    }
                    if (entry.established)
                    {
                        parts.push_back("established");
                    }
                }

                if (entry.log)
                {
                    parts.push_back("log");
                }
                return Common::Utils::join(parts, " ");
            }

        } // namespace Acl
    }     // namespace Core
} // namespace NetSim
