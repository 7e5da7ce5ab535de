#pragma once

// Ruidapipe - Ruida laser protocol over UDP
// Two roles: Sender (chunk a job, checksum each chunk, wait for ACK/NACK)
//            Relay  (arbitrate one job stream at a time, forward, capture)

// Core types and utilities
#include <ruidapipe/common.hpp>
#include <ruidapipe/endpoint.hpp>
#include <ruidapipe/protocol.hpp>
#include <ruidapipe/config.hpp>

// Transport
#include <ruidapipe/datagram.hpp>
#include <ruidapipe/datagram/udp.hpp>

// Sender role
#include <ruidapipe/checksum.hpp>
#include <ruidapipe/chunker.hpp>
#include <ruidapipe/ack.hpp>
#include <ruidapipe/sender.hpp>

// Relay role
#include <ruidapipe/sink.hpp>
#include <ruidapipe/session.hpp>
#include <ruidapipe/stats.hpp>
#include <ruidapipe/relay.hpp>

// All types are in the ruidapipe:: namespace
// Available types:
//   - ruidapipe::Message (dp::Vector<dp::u8>)
//   - ruidapipe::UdpEndpoint
//   - ruidapipe::Datagram (base class), ruidapipe::UdpDatagram
//   - ruidapipe::Chunk, ChunkSplitter, AckEngine, BackoffPolicy, Sender
//   - ruidapipe::CaptureSink (base class), FileSink
//   - ruidapipe::Session, SessionArbiter, Relay, RelayStats
//   - ruidapipe::SenderConfig, RelayConfig
