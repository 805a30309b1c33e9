// src/core/ospf/ospf_types.cpp
#include "ospf_types.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            std::string neighborStateToString(NeighborState state)
            {
                switch (state)
                {
                case NeighborState::DOWN:
                    return "Down";
                case NeighborState::ATTEMPT:
                    return "Attempt";
                case NeighborState::INIT:
                    return "Init";
                case NeighborState::TWO_WAY:
                    return "TwoWay";
                case NeighborState::EX_START:
                    return "ExStart";
                case NeighborState::EXCHANGE:
                    return "Exchange";
                case NeighborState::LOADING:
                    return "Loading";
                case NeighborState::FULL:
                    return "Full";
                }
                return "Unknown";
            }

            std::string neighborEventToString(NeighborEvent event)
            {
                switch (event)
                {
                case NeighborEvent::HELLO_RECEIVED:
                    return "HelloReceived";
                case NeighborEvent::START:
                    return "Start";
                case NeighborEvent::TWO_WAY_RECEIVED:
                    return "TwoWayReceived";
                case NeighborEvent::NEGOTIATION_DONE:
                    return "NegotiationDone";
                case NeighborEvent::EXCHANGE_DONE:
                    return "ExchangeDone";
                case NeighborEvent::BAD_LS_REQ:
                    return "BadLSReq";
                case NeighborEvent::LOADING_DONE:
                    return "LoadingDone";
                case NeighborEvent::ADJ_OK:
                    return "AdjOK?";
                case NeighborEvent::SEQ_NUMBER_MISMATCH:
                    return "SeqNumberMismatch";
                case NeighborEvent::ONE_WAY:
                    return "OneWay";
                case NeighborEvent::KILL_NBR:
                    return "KillNbr";
                case NeighborEvent::INACTIVITY_TIMER:
                    return "InactivityTimer";
                case NeighborEvent::LL_DOWN:
                    return "LLDown";
                }
                return "Unknown";
            }

            std::string interfaceStateToString(InterfaceState state)
            {
                switch (state)
                {
                case InterfaceState::DOWN:
                    return "Down";
                case InterfaceState::LOOPBACK:
                    return "Loopback";
                case InterfaceState::WAITING:
                    return "Waiting";
                case InterfaceState::POINT_TO_POINT:
                    return "PointToPoint";
                case InterfaceState::DR_OTHER:
                    return "DROther";
                case InterfaceState::BACKUP:
                    return "Backup";
                case InterfaceState::DR:
                    return "DR";
                }
                return "Unknown";
            }

            std::string networkTypeToString(NetworkType type)
            {
                switch (type)
                {
                case NetworkType::BROADCAST:
                    return "broadcast";
                case NetworkType::POINT_TO_POINT:
                    return "point-to-point";
                case NetworkType::NBMA:
                    return "non-broadcast";
                case NetworkType::POINT_TO_MULTIPOINT:
                    return "point-to-multipoint";
                }
                return "unknown";
            }

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim
