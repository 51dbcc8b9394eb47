/*
 * Copyright (c) 2013, 2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Main Implementation
  */

#include <iostream>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <unistd.h>
#include <syslog.h>

using namespace std;

/** Feature Utility Includes */
#include "daemon_option.h"
#include "daemon_common.h"
#include "monBase.h"

/**
 * Cache a copy of the current hostname.
 * Use these set/get interfaces to set and retrieve it
 */
static char this_hostname [MAX_CHARS_HOSTNAME+2];

char * _hn ( void )
{
    return(&this_hostname[0]);
}

void set_hn ( char * hn )
{
    if ( hn )
        snprintf ( &this_hostname[0], MAX_CHARS_HOSTNAME+1, "%s", hn );
    else
        snprintf ( &this_hostname[0], MAX_CHARS_HOSTNAME+1, "%s", "localhost" );
}

static opts_type opts ; /**< The allocated memory for run options */

opts_type * daemon_get_opts_ptr ( void )
{
    return(&opts);
}

bool ltc ( void )
{
    return(opts.front);
}

void print_help ( void )
{
   printf ("\nUsage: arraymon options ...\n");
   printf ("\t-h --help               -  Display this usage information\n");
   printf ("\t-a --array <address>    -  Storage array address\n");
   printf ("\t-P --port <port>        -  Storage array REST API port\n");
   printf ("\t-u --username <un>      -  Storage array username\n");
   printf ("\t-p --password <pw>      -  Storage array password\n");
   printf ("\t-k --apikey <key>       -  Storage array api token ; used before username/password\n");
   printf ("\t-s --scope <scope>      -  capacity, performance, hardware, drive, volume or volumemgmt\n");
   printf ("\t-V --volume <name>      -  Volume for the volume scope\n");
   printf ("\t-U --prov-url <url>     -  Provisioning API base url\n");
   printf ("\t-n --prov-user <un>     -  Provisioning API username\n");
   printf ("\t-H --prov-hash <hash>   -  Provisioning API passhash\n");
   printf ("\t-t --template <id>      -  Instance to clone for each new volume\n");
   printf ("\t-g --group <id>         -  Group the new instances are created in\n");
   printf ("\t-c --config <file>      -  Config file ; default %s\n", DAEMON_CONFIG_FILE);
   printf ("\t-f --foreground         -  Log to the console (stderr)\n");
   printf ("\t-d --debug <0..15>      -  Enter specified debug level\n");
   printf ("\t-v --verbose            -  Show command line arguments\n");
   printf ("\n" );
}

void opts_init ( void)
{
    opts.help     = false ;
    opts.bad_arg  = false ;
    opts.verbose  = false ;
    opts.debug    = 0     ;
    opts.front    = false ;
    opts.port     = 0     ;
    opts.array    = ""    ;
    opts.username = ""    ;
    opts.password = ""    ;
    opts.apikey   = ""    ;
    opts.scope    = ""    ;
    opts.volume   = ""    ;
    opts.config   = DAEMON_CONFIG_FILE ;
    opts.prov_url      = "" ;
    opts.prov_user     = "" ;
    opts.prov_hash     = "" ;
    opts.prov_template = "" ;
    opts.prov_group    = "" ;
}

int parseArg ( int argc, char * argv[], opts_type * opts_ptr )
{
    int arg_count     = 0 ;
    int next_option   = 0 ;
    int cmd_arg_count = 1 ; /* command args start at 1 */

   /* A string listing of valid short options letters. */
   const char* const short_options = "a:P:u:p:k:s:V:U:n:H:t:g:c:d:hfv";

   /* An array listing of valid long options. */
   const struct option long_options[] =
   {
         { "array"     , 1, NULL, 'a' },
         { "port"      , 1, NULL, 'P' },
         { "username"  , 1, NULL, 'u' },
         { "password"  , 1, NULL, 'p' },
         { "apikey"    , 1, NULL, 'k' },
         { "scope"     , 1, NULL, 's' },
         { "volume"    , 1, NULL, 'V' },
         { "prov-url"  , 1, NULL, 'U' },
         { "prov-user" , 1, NULL, 'n' },
         { "prov-hash" , 1, NULL, 'H' },
         { "template"  , 1, NULL, 't' },
         { "group"     , 1, NULL, 'g' },
         { "config"    , 1, NULL, 'c' },
         { "debug"     , 1, NULL, 'd' },
         { "help"      , 0, NULL, 'h' },
         { "foreground", 0, NULL, 'f' },
         { "verbose"   , 0, NULL, 'v' },
         {  NULL       , 0, NULL,  0  } /* Required at end of array. */
   };

   do
   {
      next_option = getopt_long (argc, argv, short_options, long_options, NULL);
      arg_count++ ;
      switch (next_option)
      {
         case -1: /* Done with options */
         {
            break ;
         }
         case 'f': /* -f or --foreground */
         {
             opts_ptr->front = true ;
             cmd_arg_count++ ;
             break ;
         }
         case 'h': /* -h or --help */
         {
             opts_ptr->help = true ;
             cmd_arg_count++ ;
             return ( PASS ) ;
         }
         case 'd': /* -d or --debug */
         {
             opts_ptr->debug = atoi(optarg) ;
             cmd_arg_count++ ;
             break;
         }
         case 'a': /* -a or --array */
         {
             opts_ptr->array = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'P': /* -P or --port */
         {
             opts_ptr->port = atoi(optarg) ;
             if ( opts_ptr->port <= 0 )
             {
                 opts_ptr->bad_arg = true ;
             }
             cmd_arg_count++ ;
             break;
         }
         case 'u': /* -u or --username */
         {
             opts_ptr->username = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'p': /* -p or --password */
         {
             opts_ptr->password = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'k': /* -k or --apikey */
         {
             opts_ptr->apikey = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 's': /* -s or --scope */
         {
             opts_ptr->scope = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'V': /* -V or --volume */
         {
             opts_ptr->volume = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'U': /* -U or --prov-url */
         {
             opts_ptr->prov_url = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'n': /* -n or --prov-user */
         {
             opts_ptr->prov_user = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'H': /* -H or --prov-hash */
         {
             opts_ptr->prov_hash = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 't': /* -t or --template */
         {
             opts_ptr->prov_template = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'g': /* -g or --group */
         {
             opts_ptr->prov_group = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'c': /* -c or --config */
         {
             opts_ptr->config = optarg ;
             cmd_arg_count++ ;
             break;
         }
         case 'v': /* -v or --verbose */
         {
             opts_ptr->verbose = true ;
             cmd_arg_count++ ;
             break;
         }
         case '?':
         default: /* Something else: unexpected */
         {
             fprintf (stderr, "Unsupported option (%c)\n", next_option );
             opts_ptr->bad_arg = true ;
             return ( cmd_arg_count );
         }
      }
   } while (next_option != -1);

   if ( optind < argc )
   {
       fprintf (stderr, "Unexpected argument '%s'\n", argv[optind] );
       opts_ptr->bad_arg = true ;
   }

   /* never echo credentials */
   if (opts_ptr->verbose)
   {
      for ( int i = 0 ; i < argc; ++i)
      {
         if (( i > 0 ) &&
             (( !strcmp ( argv[i-1], "-p" )) || ( !strcmp ( argv[i-1], "--password" )) ||
              ( !strcmp ( argv[i-1], "-k" )) || ( !strcmp ( argv[i-1], "--apikey"   )) ||
              ( !strcmp ( argv[i-1], "-H" )) || ( !strcmp ( argv[i-1], "--prov-hash"))))
         {
            fprintf (stderr, "Arg [%d]: ********\n", i );
         }
         else
         {
            fprintf (stderr, "Arg [%d]: %s\n", i, argv[i]);
         }
      }
      fprintf (stderr, "\n");
   }
   return ( cmd_arg_count ) ;
}

int main(int argc, char *argv[])
{
   int rc = FAIL ;
   char hostname [MAX_CHARS_HOSTNAME+1] ;

   MEMSET_ZERO(hostname);
   if ( gethostname ( hostname, MAX_CHARS_HOSTNAME ) == 0 )
       set_hn ( hostname );
   else
       set_hn ( NULL );

   /* Manually Zero the main service structs */
   opts_init ();

   /* Parse the argument list */
   parseArg ( argc, argv, &opts );

   if ( opts.help )
   {
       print_help ( );
       exit (0) ;
   }

   if ( !opts.front )
   {
       open_syslog();
   }

   /* Init the daemon config structure */
   daemon_config_default ( daemon_get_cfg_ptr() );

   if ( daemon_configure ( opts.config.data() ) != PASS )
   {
       elog ("failed to load config file '%s'\n", opts.config.c_str());
       opts.bad_arg = true ;
   }

   /* command line debug level overrides the config file */
   if ( opts.debug )
   {
       daemon_get_cfg_ptr()->debug_level = opts.debug ;
   }

   ilog ("------------------------------------------------------\n");

   rc = daemon_service_run ( );

   daemon_exit ();
   exit (rc) ;
}
