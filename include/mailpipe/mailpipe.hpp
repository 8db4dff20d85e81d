#pragma once

// Mailpipe - store-and-forward chat over UDP
// A reliable request/reply layer (correlation ids, retransmission, duplicate
// suppression) carrying a small directory-and-mailbox protocol.

// Core types and utilities
#include <mailpipe/cancel.hpp>
#include <mailpipe/common.hpp>
#include <mailpipe/endpoint.hpp>
#include <mailpipe/file.hpp>

// Transports
#include <mailpipe/datagram.hpp>
#include <mailpipe/datagram/lossy.hpp>
#include <mailpipe/datagram/udp.hpp>

// Wire protocol
#include <mailpipe/protocol/codec.hpp>
#include <mailpipe/protocol/message.hpp>
#include <mailpipe/protocol/version.hpp>

// Reliable send engine
#include <mailpipe/reliable/metrics.hpp>
#include <mailpipe/reliable/sender.hpp>

// Server side
#include <mailpipe/server/directory.hpp>
#include <mailpipe/server/handler.hpp>
#include <mailpipe/server/mailbox_store.hpp>
#include <mailpipe/server/reply_cache.hpp>
#include <mailpipe/server/server.hpp>

// Client side
#include <mailpipe/client/client.hpp>
#include <mailpipe/client/session.hpp>

// All types are in the mailpipe:: namespace
// Available types:
//   - mailpipe::Message (dp::Vector<dp::u8>), mailpipe::UdpEndpoint
//   - mailpipe::Datagram (base class), UdpDatagram, LossyDatagram
//   - mailpipe::protocol::ProtocolMessage and its payloads, encode()/decode()
//   - mailpipe::ReliableSender
//   - mailpipe::Directory, MailboxStore, ReplyCache, RequestHandler, ChatServer
//   - mailpipe::SessionStore, ChatClient
