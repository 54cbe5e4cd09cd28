#include <algorithm>
#include <expected>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/locale/utf.hpp>

#include <setmint/controller/execution_context.hpp>
#include <setmint/controller/state.hpp>
#include <setmint/crypto.hpp>
#include <setmint/memory.hpp>
#include <setmint/protocol/serialization.hpp>

namespace setmint::controller {

constexpr auto event_name_limit = 128;

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

/**
 * Points the context at a child node for the duration of a call and restores
 * the previous node on exit.
 */
class node_guard final
{
public:
  node_guard( const node_guard& )            = delete;
  node_guard( node_guard&& )                 = delete;
  node_guard& operator=( const node_guard& ) = delete;
  node_guard& operator=( node_guard&& )      = delete;

  node_guard( state_db::state_node_ptr& slot, state_db::state_node_ptr next ):
      _slot( &slot ),
      _previous( std::exchange( slot, std::move( next ) ) )
  {}

  ~node_guard()
  {
    *_slot = std::move( _previous );
  }

private:
  state_db::state_node_ptr* _slot;
  state_db::state_node_ptr _previous;
};

execution_context::execution_context( const program_registry& registry, controller::intent intent ):
    _registry( registry ),
    _intent( intent )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::set_entropy( const crypto::digest& entropy ) noexcept
{
  _entropy = entropy;
}

chronicler& execution_context::chronicler()
{
  return _chronicler;
}

result< protocol::block_receipt > execution_context::apply( const protocol::block& block )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  protocol::block_receipt receipt;

  for( const auto& transaction: block.transactions )
  {
    auto transaction_receipt = apply( transaction );

    if( !transaction_receipt )
      return std::unexpected( transaction_receipt.error() );

    receipt.transaction_receipts.emplace_back( std::move( transaction_receipt.value() ) );
  }

  receipt.id     = block.id;
  receipt.height = block.height;

  return receipt;
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _transaction = &transaction;

  if( account_nonce( transaction.signer ) + 1 != transaction.nonce )
    return std::unexpected( controller_errc::invalid_nonce );

  if( auto error = set_account_nonce( transaction.signer, transaction.nonce ); error )
    return std::unexpected( error );

  auto checkpoint = _chronicler.mark();
  auto block_node = _state_node;

  auto error = [ & ]() -> std::error_code
  {
    auto transaction_node = block_node->make_child();
    node_guard guard( _state_node, transaction_node );

    for( const auto& o: transaction.operations )
    {
      auto error = std::visit(
        [ this ]( const auto& op )
        {
          return apply( op );
        },
        o );

      if( error )
        return error;
    }

    transaction_node->squash();
    return reversion_errc::ok;
  }();

  _transaction = nullptr;

  protocol::transaction_receipt receipt;

  if( error )
  {
    if( error.category() == controller_category() )
      return std::unexpected( error );

    receipt.reverted = true;
    receipt.code     = error.value();
    receipt.message  = error.message();

    auto frames = _chronicler.frames( checkpoint );
    auto failed = std::ranges::find_if( frames,
                                        []( const auto& frame )
                                        {
                                          return frame->code != 0 && !frame->stderr.empty();
                                        } );

    if( failed != frames.end() )
      receipt.message += ": " + std::string( memory::as_string_view( ( *failed )->stderr ) );

    _chronicler.rollback( checkpoint );
    _chronicler.push_log( "transaction reverted: " + receipt.message );
  }

  receipt.id     = transaction.id;
  receipt.signer = transaction.signer;
  receipt.frames = _chronicler.frames( checkpoint );
  receipt.events = _chronicler.events( checkpoint );
  receipt.logs   = _chronicler.logs( checkpoint );

  return receipt;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  auto result = run_program( _transaction->signer, op.id, op.input.stdin, op.value, op.input.arguments );

  if( !result )
    return result.error();

  return reversion_errc::ok;
}

std::error_code execution_context::apply( const protocol::transfer& op )
{
  return move_value( _transaction->signer, op.to, op.value );
}

result< protocol::program_output > execution_context::read_program( const protocol::account& id,
                                                                    const protocol::program_input& input )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  return run_program( protocol::account{}, id, input.stdin, 0, input.arguments );
}

result< protocol::program_output > execution_context::run_program( const protocol::account& caller,
                                                                   const protocol::account& id,
                                                                   std::span< const std::byte > stdin,
                                                                   std::uint64_t value,
                                                                   std::span< const std::string > arguments )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !id.program() )
    return std::unexpected( reversion_errc::invalid_program );

  auto registry_iterator = _registry.find( id );
  if( registry_iterator == _registry.end() )
    return std::unexpected( reversion_errc::invalid_program );

  if( value && _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  if( auto error = _stack.push(
        { .program_id = id, .caller = caller, .value = value, .arguments = arguments, .stdin = stdin } );
      error )
    return std::unexpected( error );

  frame_guard stack_guard( _stack );

  auto call_node = _state_node->make_child();
  std::error_code error;

  {
    node_guard guard( _state_node, call_node );
    auto checkpoint = _chronicler.mark();

    if( value )
      error = move_value( caller, id, value );

    if( !error )
      error = registry_iterator->second->run( this, arguments );

    if( error )
      _chronicler.rollback( checkpoint );
  }

  auto& stack_frame = _stack.current();

  auto frame = std::make_shared< protocol::program_frame >();
  frame->id        = id;
  frame->caller    = caller;
  frame->value     = value;
  frame->depth     = static_cast< std::uint32_t >( _stack.depth() );
  frame->arguments = std::vector( arguments.begin(), arguments.end() );
  frame->stdin     = std::vector( stdin.begin(), stdin.end() );
  frame->code      = error.value();
  frame->stdout    = stack_frame.stdout;
  frame->stderr    = stack_frame.stderr;
  _chronicler.add_frame( frame );

  if( error )
    return std::unexpected( error );

  call_node->squash();

  protocol::program_output output;
  output.stdout = std::move( stack_frame.stdout );
  output.stderr = std::move( stack_frame.stderr );

  return output;
}

std::uint64_t execution_context::account_nonce( const protocol::account& account ) const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto nonce_bytes = _state_node->get( state::space::transaction_nonce(), account ); nonce_bytes )
    return memory::from_little_endian< std::uint64_t >( *nonce_bytes );

  return 0;
}

std::error_code execution_context::set_account_nonce( const protocol::account& account, std::uint64_t nonce )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _state_node->put( state::space::transaction_nonce(), account, memory::to_little_endian( nonce ) );
  return reversion_errc::ok;
}

std::uint64_t execution_context::account_balance( const protocol::account& account ) const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto balance_bytes = _state_node->get( state::space::account_balance(), account ); balance_bytes )
    return memory::from_little_endian< std::uint64_t >( *balance_bytes );

  return 0;
}

std::error_code
execution_context::move_value( const protocol::account& from, const protocol::account& to, std::uint64_t value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  auto from_balance = account_balance( from );
  if( from_balance < value )
    return reversion_errc::insufficient_balance;

  if( from == to || value == 0 )
    return reversion_errc::ok;

  auto to_balance = account_balance( to );
  if( to_balance > std::numeric_limits< std::uint64_t >::max() - value )
    return reversion_errc::overflow;

  _state_node->put( state::space::account_balance(), from, memory::to_little_endian( from_balance - value ) );
  _state_node->put( state::space::account_balance(), to, memory::to_little_endian( to_balance + value ) );

  return reversion_errc::ok;
}

state::head execution_context::head() const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto head_bytes = _state_node->get( state::space::metadata(), state::key::head() ); head_bytes )
    return protocol::from_binary< state::head >( *head_bytes );

  return state::head{};
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.current().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.current().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.current().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  auto& frame = _stack.current();

  if( frame.stdin.size() - frame.input_offset < buffer.size() )
    return reversion_errc::end_of_input;

  std::ranges::copy( frame.stdin.subspan( frame.input_offset, buffer.size() ), buffer.begin() );
  frame.input_offset += buffer.size();

  return reversion_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id )
{
  state_db::object_space space{ .system = false, .id = id };
  std::ranges::copy( _stack.current().program_id, space.address.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

void execution_context::log( std::string_view message )
{
  _chronicler.push_log( message );
}

std::error_code execution_context::event( std::string_view name,
                                          std::span< const std::byte > data,
                                          const std::vector< protocol::account >& impacted )
{
  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  if( name.empty() || name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( !validate_utf( name ) )
    return reversion_errc::invalid_event_name;

  protocol::event event;
  event.source   = _stack.current().program_id;
  event.name     = std::string( name );
  event.data     = std::vector( data.begin(), data.end() );
  event.impacted = impacted;

  _chronicler.push_event( std::move( event ) );

  return reversion_errc::ok;
}

const protocol::account& execution_context::get_caller()
{
  return _stack.current().caller;
}

const protocol::account& execution_context::get_self()
{
  return _stack.current().program_id;
}

std::uint64_t execution_context::get_value()
{
  return _stack.current().value;
}

std::uint64_t execution_context::get_balance( const protocol::account& account )
{
  return account_balance( account );
}

std::error_code execution_context::transfer_value( const protocol::account& to, std::uint64_t value )
{
  if( to.null() )
    return program::program_errc::zero_address;

  return move_value( get_self(), to, value );
}

crypto::digest execution_context::get_entropy()
{
  return _entropy;
}

result< protocol::program_output > execution_context::call_program( const protocol::account& account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::uint64_t value,
                                                                    std::span< const std::string > arguments )
{
  return run_program( get_self(), account, stdin, value, arguments );
}

} // namespace setmint::controller
