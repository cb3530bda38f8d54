#pragma once

namespace ballot
{
class audit_log;
class cache_invalidator;
class confirmation_solicitor;
class consensus_config;
class consensus_evaluator;
class coordinator;
class elections;
class evaluation_queue;
class logger;
class node_config;
class node_registry;
class notification_sink;
class notifier;
class round_manager;
class stats;
class tomlconfig;
class vote_record;
class vote_store;
}
